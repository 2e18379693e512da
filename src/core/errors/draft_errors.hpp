#pragma once
#include <string>
#include <utility>
#include <variant>

namespace draftline::core::errors {

    // 1. Typed error kinds, one per failure category a caller can branch on
    enum class ErrorKind {
        UnknownTool,              // Tool name not in the catalog
        MissingRequiredArgument,  // A catalog-required field was not supplied
        InvalidArgument,          // A supplied field has the wrong JSON type
        InvalidDraftId,           // draft_id absent or not in the registry
        InvalidDraftState,        // Transition not allowed (e.g. draft already saved)
        CompositionBackendError,  // The Composer call failed or timed out
        InternalError,            // Anything else that escaped
        Input                     // Bad CLI flag or startup configuration
    };

    // The standardized error payload
    struct DraftError {
        ErrorKind kind;
        std::string message;
        std::string code = "internal_error";
        std::string detail = "";  // Diagnostic trace, never shown to remote callers unless enabled
    };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a DraftError.
    template <typename T>
    using Result = std::variant<T, DraftError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<DraftError>(result);
    }

    template <typename T>
    const DraftError& get_error(const Result<T>& result) {
        return std::get<DraftError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_code(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UnknownTool:
                return "unknown_tool";
            case ErrorKind::MissingRequiredArgument:
                return "missing_required_argument";
            case ErrorKind::InvalidArgument:
                return "invalid_argument";
            case ErrorKind::InvalidDraftId:
                return "invalid_draft_id";
            case ErrorKind::InvalidDraftState:
                return "invalid_draft_state";
            case ErrorKind::CompositionBackendError:
                return "composition_backend_error";
            case ErrorKind::InternalError:
                return "internal_error";
            case ErrorKind::Input:
                return "input";
            default:
                return "unknown_error";
        }
    }

    // Builds an error whose code is the kind's canonical code
    inline DraftError make_error(const ErrorKind kind, std::string message,
                                 std::string detail = "") {
        return DraftError{kind, std::move(message), to_code(kind), std::move(detail)};
    }

} // namespace draftline::core::errors
