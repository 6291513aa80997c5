#ifndef DCTBLUR_ERRORS_HPP
#define DCTBLUR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace dctblur {

// Grid (or requested mask) has zero rows or columns.
class InvalidDimensionError : public std::invalid_argument {
public:
    explicit InvalidDimensionError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Blur amount <= 0, unknown transform kind, or an option the chosen path does not support.
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Kernel / spectrum / grid shapes disagree. Indicates a bug in the caller, not bad input data.
class ShapeMismatchError : public std::logic_error {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace dctblur

#endif // DCTBLUR_ERRORS_HPP
