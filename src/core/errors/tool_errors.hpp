#pragma once
#include <string>
#include <variant>

namespace wasmbox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,          // E.g., a bad CLI flag or malformed argument value
        Validation,     // E.g., a package or manifest that fails its checks
        Configuration,  // E.g., a manifest declaring two binary parameters
        Policy,         // E.g., a file read under a write-only policy
        Execution,      // E.g., the isolate died without answering
        Timeout,
        Cancelled,
        Internal        // E.g., a failed fork or socketpair
    };

    // The standardized error payload
    struct ToolError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy
    // A Result holds either a successful value of type T, OR a ToolError.
    template <typename T>
    using Result = std::variant<T, ToolError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<ToolError>(result);
    }

    template <typename T>
    const ToolError& get_error(const Result<T>& result) {
        return std::get<ToolError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T&& take_value(Result<T>& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Configuration: return "configuration";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Timeout: return "timeout";
            case ErrorCategory::Cancelled: return "cancelled";
            case ErrorCategory::Internal: return "internal";
        }
        return "unknown";
    }

} // namespace wasmbox::core::errors
