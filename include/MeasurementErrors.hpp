/**
 * @file MeasurementErrors.hpp
 * @brief Exception types raised by the measurement components
 *
 * - InvalidConfigurationError: malformed setup, raised at construction or by
 *   setters, never recovered by the library.
 * - InvalidStateError: an operation requested in a state that forbids it.
 * - InvalidAmplitudeError: a complex amplitude pair that cannot be normalized.
 */

#ifndef MEASUREMENT_ERRORS_HPP
#define MEASUREMENT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace QMSIM {

class InvalidConfigurationError : public std::invalid_argument {
public:
    explicit InvalidConfigurationError(const std::string& what)
        : std::invalid_argument("Invalid configuration: " + what) {}
};

class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what)
        : std::logic_error("Invalid state: " + what) {}
};

class InvalidAmplitudeError : public std::domain_error {
public:
    explicit InvalidAmplitudeError(const std::string& what)
        : std::domain_error("Invalid amplitude: " + what) {}
};

} // namespace QMSIM

#endif // MEASUREMENT_ERRORS_HPP
