/**
 * @file exceptions.h
 * @brief Project-wide base exception hierarchy
 *
 * Hierarchy:
 * - ArchflowBaseException (root)
 *   ├─ ConfigurationException
 *   ├─ IOException
 *   ├─ ResourceNotFoundException
 *   ├─ ValidationException
 *   └─ InvalidStateException
 *
 * Workflow engine exceptions derive from these.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace archflow {
namespace common_utils {

/**
 * @brief Root of all project exceptions
 *
 * Carries an optional integer error code next to the message.
 */
class ArchflowBaseException : public std::runtime_error {
public:
    /**
     * @brief Constructor
     * @param message Exception message
     */
    explicit ArchflowBaseException(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * @brief Constructor with error code
     * @param message Exception message
     * @param code Error code
     */
    ArchflowBaseException(const std::string& message, int code)
        : std::runtime_error(message), code_(code) {}

    /**
     * @brief Returns the error code
     */
    int getCode() const noexcept { return code_; }

protected:
    int code_ = 0;
};

// ============================================================================
// Common exception types
// ============================================================================

/**
 * @brief Invalid configuration file or value
 */
class ConfigurationException : public ArchflowBaseException {
public:
    explicit ConfigurationException(const std::string& message)
        : ArchflowBaseException(message) {}

    ConfigurationException(const std::string& message, int code)
        : ArchflowBaseException(message, code) {}
};

/**
 * @brief File or stream I/O failed
 */
class IOException : public ArchflowBaseException {
public:
    explicit IOException(const std::string& message)
        : ArchflowBaseException(message) {}

    IOException(const std::string& message, int code)
        : ArchflowBaseException(message, code) {}
};

/**
 * @brief A named resource does not exist
 */
class ResourceNotFoundException : public ArchflowBaseException {
public:
    explicit ResourceNotFoundException(const std::string& message)
        : ArchflowBaseException(message) {}

    ResourceNotFoundException(const std::string& message, int code)
        : ArchflowBaseException(message, code) {}
};

/**
 * @brief Argument or document validation failed
 */
class ValidationException : public ArchflowBaseException {
public:
    explicit ValidationException(const std::string& message)
        : ArchflowBaseException(message) {}

    ValidationException(const std::string& message, int code)
        : ArchflowBaseException(message, code) {}
};

/**
 * @brief The target is not in a state that allows the requested call
 */
class InvalidStateException : public ArchflowBaseException {
public:
    explicit InvalidStateException(const std::string& message)
        : ArchflowBaseException(message) {}

    InvalidStateException(const std::string& message, int code)
        : ArchflowBaseException(message, code) {}
};

} // namespace common_utils
} // namespace archflow
