#pragma once
#include <string>
#include <utility>
#include <variant>

namespace conductor::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation,      // Malformed input, never retried
        Connection,      // Downstream resource unavailable
        QuotaExceeded,   // Per-user resource limit hit
        StageExecution,  // A worker stage's own logic failed
        Timeout,         // Run deadline exceeded or run cancelled
        Internal         // Invariant violation inside the core
    };

    // The standardized error payload
    struct OrchestrationError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR an error.
    template <typename T>
    using Result = std::variant<T, OrchestrationError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<OrchestrationError>(result);
    }

    template <typename T>
    const OrchestrationError& get_error(const Result<T>& result) {
        return std::get<OrchestrationError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    // Transient failures are worth another attempt within the same run.
    inline bool is_transient(const ErrorCategory category) {
        return category == ErrorCategory::StageExecution ||
               category == ErrorCategory::Connection;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation:     return "validation";
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::QuotaExceeded:  return "quota_exceeded";
            case ErrorCategory::StageExecution: return "stage_execution";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::Internal:       return "internal";
            default: return "unknown";
        }
    }

} // namespace conductor::core::errors
