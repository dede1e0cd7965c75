#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class RoadPathError : public std::runtime_error {
public:
  explicit RoadPathError(const std::string &what) : std::runtime_error(what) {}
};

// Unknown weight dimension, non-positive max speed.
class InvalidParameter : public RoadPathError {
public:
  explicit InvalidParameter(const std::string &what) : RoadPathError(what) {}
};

// City name or id that does not resolve to a node.
class NotFound : public RoadPathError {
public:
  explicit NotFound(const std::string &what) : RoadPathError(what) {}
};

// Missing columns, short rows, unparseable fields, unreadable files.
class DataIntegrityError : public RoadPathError {
public:
  explicit DataIntegrityError(const std::string &what) : RoadPathError(what) {}
};

#endif // ERRORS_HPP
