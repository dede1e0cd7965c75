#ifndef GEODESIC_HPP
#define GEODESIC_HPP

#include "types.hpp"

inline double toRadians(double degree) { return degree * PI / 180.0; }

// Great-circle distance on a sphere of mean Earth radius (kilometers).
double haversineKm(double lat1, double lon1, double lat2, double lon2);

// Ellipsoidal (WGS84) inverse geodesic distance in kilometers. When the
// iteration does not converge (nearly antipodal points) the great circle on a
// sphere of the polar radius is returned instead.
double geodesicKm(double lat1, double lon1, double lat2, double lon2);

#endif // GEODESIC_HPP
