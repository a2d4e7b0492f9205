#ifndef LANDCALC_ERRORS_HPP
#define LANDCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace landcalc {

/**
 * @brief Base exception for projection errors
 *
 * Everything the engine raises derives from this type so callers can catch
 * projection failures without catching unrelated runtime errors.
 */
class ProjectionError : public std::runtime_error {
public:
    explicit ProjectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a project or referenced record is absent from the provider
 */
class NotFoundError : public ProjectionError {
public:
    explicit NotFoundError(const std::string& message)
        : ProjectionError("Not found: " + message) {}
};

/**
 * @brief Raised for configurations the engine deliberately does not model
 *
 * Loan take-out chains and non cost-incurred draw triggers land here.
 */
class UnsupportedConfigurationError : public ProjectionError {
public:
    explicit UnsupportedConfigurationError(const std::string& message)
        : ProjectionError("Unsupported configuration: " + message) {}
};

/**
 * @brief Raised when input records are malformed
 */
class ValidationError : public ProjectionError {
public:
    explicit ValidationError(const std::string& message)
        : ProjectionError("Validation error: " + message) {}
};

} // namespace landcalc

#endif // LANDCALC_ERRORS_HPP
