#pragma once
#include <string>
#include <variant>

namespace runguard::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., Entry file missing or an invalid CLI flag
        Launch,     // E.g., fork/exec or pipe creation failed
        Execution,  // E.g., the service never bound a port
        Config,     // E.g., malformed runner configuration file
        Internal    // E.g., artifact directory could not be created
    };

    // The standardized error payload
    struct RunError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result will hold either a successful value of type T, OR a RunError.
    template <typename T>
    using Result = std::variant<T, RunError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<RunError>(result);
    }

    template <typename T>
    const RunError& get_error(const Result<T>& result) {
        return std::get<RunError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Launch:    return "launch";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Config:    return "config";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace runguard::core::errors
