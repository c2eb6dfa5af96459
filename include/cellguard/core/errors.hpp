/**
 * @file errors.hpp
 * @brief Exception hierarchy for isolation and policy failures
 *
 * Validation failures are thrown synchronously to the direct caller. The
 * category lets callers tell malformed input apart from a well-formed value
 * that violates configured policy.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cellguard {
namespace core {

/**
 * @enum ErrorCategory
 * @brief Coarse classification of isolation errors
 */
enum class ErrorCategory {
    INVALID_ARGUMENT,   ///< Null, empty or malformed input
    POLICY_VIOLATION,   ///< Well-formed value rejected by policy
    RUNTIME,            ///< Container runtime call failed
    CONFIG              ///< Configuration could not be loaded or is out of range
};

std::string ErrorCategoryToString(ErrorCategory category);

/**
 * @class IsolationError
 * @brief Base of every error thrown by cellguard
 */
class IsolationError : public std::runtime_error {
public:
    IsolationError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory Category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

class InvalidArgumentError : public IsolationError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : IsolationError(ErrorCategory::INVALID_ARGUMENT, message) {}
};

class PolicyViolationError : public IsolationError {
public:
    explicit PolicyViolationError(const std::string& message)
        : IsolationError(ErrorCategory::POLICY_VIOLATION, message) {}
};

class RuntimeError : public IsolationError {
public:
    explicit RuntimeError(const std::string& message)
        : IsolationError(ErrorCategory::RUNTIME, message) {}
};

class ConfigError : public IsolationError {
public:
    explicit ConfigError(const std::string& message)
        : IsolationError(ErrorCategory::CONFIG, message) {}
};

} // namespace core
} // namespace cellguard
