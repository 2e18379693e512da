#pragma once

#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace draftline::protocol {

struct EnvelopeOptions {
    // Local channels get the diagnostic trace; network channels usually do not.
    bool include_traceback = true;
};

// Renders a ToolResult as the uniform result envelope:
//   {"success": true, ...payload}
//   {"success": false, "error": "...", "error_kind": "...", "traceback"?: "..."}
nlohmann::json to_envelope(const ToolResult& result, const EnvelopeOptions& options = {});

ToolResult make_success(nlohmann::json payload);
ToolResult make_failure(core::errors::DraftError error);

}  // namespace draftline::protocol
