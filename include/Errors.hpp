// Exception types raised by the CKD spectral discretization library.
#pragma once

#include <stdexcept>
#include <string>

namespace ckd
{
/// Bad shape or value supplied by a caller (unknown quadrature type, unknown
/// filter type, unrecognized selection spec, inverted filter interval, ...).
class ConfigError : public std::invalid_argument
{
public:
    explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
};

/// A structural invariant of a constructed object is violated.
class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError(const std::string &what) : std::invalid_argument(what) {}
};

/// Raised by a DatasetStore when a logical path has no backing data.
class DatasetNotFoundError : public std::runtime_error
{
public:
    explicit DatasetNotFoundError(const std::string &what) : std::runtime_error(what) {}
};
}  // namespace ckd
