#include "protocol/envelope.hpp"

#include <utility>

namespace draftline::protocol {

using nlohmann::json;

json to_envelope(const ToolResult& result, const EnvelopeOptions& options) {
    json envelope = json::object();
    envelope["success"] = result.success;

    if (result.success) {
        if (result.payload.is_object()) {
            for (auto it = result.payload.begin(); it != result.payload.end(); ++it) {
                if (it.key() == "success") {
                    continue;
                }
                envelope[it.key()] = it.value();
            }
        } else if (!result.payload.is_null()) {
            envelope["result"] = result.payload;
        }
        return envelope;
    }

    if (!result.error.has_value()) {
        envelope["error"] = "Unknown failure";
        envelope["error_kind"] = core::errors::to_code(core::errors::ErrorKind::InternalError);
        return envelope;
    }

    const auto& error = result.error.value();
    envelope["error"] = error.message;
    envelope["error_kind"] = error.code;
    if (options.include_traceback && !error.detail.empty()) {
        envelope["traceback"] = error.detail;
    }
    return envelope;
}

ToolResult make_success(json payload) {
    ToolResult result;
    result.success = true;
    result.payload = std::move(payload);
    return result;
}

ToolResult make_failure(core::errors::DraftError error) {
    ToolResult result;
    result.success = false;
    result.payload = json::object();
    result.error = std::move(error);
    return result;
}

}  // namespace draftline::protocol
