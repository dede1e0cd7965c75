#include "geodesic.hpp"
#include <algorithm>
#include <cmath>

namespace {
const int VINCENTY_MAX_ITERATIONS = 200;
const double VINCENTY_TOLERANCE = 1e-12;
} // namespace

namespace {
double hav(double theta) {
  double s = std::sin(theta / 2);
  return s * s;
}

// Central angle between two points on a sphere, in radians.
double centralAngle(double lat1, double lon1, double lat2, double lon2) {
  double phi1 = toRadians(lat1);
  double phi2 = toRadians(lat2);
  double h = hav(phi2 - phi1) +
             std::cos(phi1) * std::cos(phi2) * hav(toRadians(lon2 - lon1));
  return 2 * std::asin(std::sqrt(std::min(1.0, h)));
}
} // namespace

double haversineKm(double lat1, double lon1, double lat2, double lon2) {
  return R_EARTH_MEAN * centralAngle(lat1, lon1, lat2, lon2) / 1000.0;
}

// --- Vincenty Inverse ---
double geodesicKm(double lat1, double lon1, double lat2, double lon2) {
  if (lat1 == lat2 && lon1 == lon2)
    return 0.0;

  const double f = WGS84_F;
  double L = toRadians(lon2 - lon1);
  double U1 = std::atan((1 - f) * std::tan(toRadians(lat1)));
  double U2 = std::atan((1 - f) * std::tan(toRadians(lat2)));
  double sinU1 = std::sin(U1), cosU1 = std::cos(U1);
  double sinU2 = std::sin(U2), cosU2 = std::cos(U2);

  double lambda = L;
  double sinSigma = 0, cosSigma = 0, sigma = 0;
  double cosSqAlpha = 0, cos2SigmaM = 0;
  bool converged = false;

  for (int i = 0; i < VINCENTY_MAX_ITERATIONS; ++i) {
    double sinLambda = std::sin(lambda);
    double cosLambda = std::cos(lambda);
    double t1 = cosU2 * sinLambda;
    double t2 = cosU1 * sinU2 - sinU1 * cosU2 * cosLambda;
    sinSigma = std::sqrt(t1 * t1 + t2 * t2);
    if (sinSigma == 0)
      break; // antipodal on the equator; no unique geodesic
    cosSigma = sinU1 * sinU2 + cosU1 * cosU2 * cosLambda;
    sigma = std::atan2(sinSigma, cosSigma);
    double sinAlpha = cosU1 * cosU2 * sinLambda / sinSigma;
    cosSqAlpha = 1 - sinAlpha * sinAlpha;
    // Equatorial lines have cosSqAlpha == 0
    cos2SigmaM = (cosSqAlpha != 0) ? cosSigma - 2 * sinU1 * sinU2 / cosSqAlpha
                                   : 0.0;
    double C = f / 16 * cosSqAlpha * (4 + f * (4 - 3 * cosSqAlpha));
    double lambdaPrev = lambda;
    lambda = L + (1 - C) * f * sinAlpha *
                     (sigma + C * sinSigma *
                                  (cos2SigmaM +
                                   C * cosSigma *
                                       (-1 + 2 * cos2SigmaM * cos2SigmaM)));
    if (std::fabs(lambda - lambdaPrev) < VINCENTY_TOLERANCE) {
      converged = true;
      break;
    }
  }

  // Great circle on the polar-radius sphere; never longer than the
  // ellipsoidal distance, so the A* bound stays admissible.
  if (!converged)
    return WGS84_B * centralAngle(lat1, lon1, lat2, lon2) / 1000.0;

  const double a2 = WGS84_A * WGS84_A;
  const double b2 = WGS84_B * WGS84_B;
  double uSq = cosSqAlpha * (a2 - b2) / b2;
  double A =
      1 + uSq / 16384 * (4096 + uSq * (-768 + uSq * (320 - 175 * uSq)));
  double B = uSq / 1024 * (256 + uSq * (-128 + uSq * (74 - 47 * uSq)));
  double deltaSigma =
      B * sinSigma *
      (cos2SigmaM +
       B / 4 *
           (cosSigma * (-1 + 2 * cos2SigmaM * cos2SigmaM) -
            B / 6 * cos2SigmaM * (-3 + 4 * sinSigma * sinSigma) *
                (-3 + 4 * cos2SigmaM * cos2SigmaM)));
  double meters = WGS84_B * A * (sigma - deltaSigma);
  return meters / 1000.0;
}
