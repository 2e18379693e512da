#include "protocol/jsonrpc_session.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "protocol/envelope.hpp"

namespace draftline::protocol {

using nlohmann::json;

JsonRpcSession::JsonRpcSession(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                               SessionOptions options)
    : dispatch_(std::move(dispatch)), options_(std::move(options)) {}

json JsonRpcSession::make_error(const json& id, const int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

std::optional<json> JsonRpcSession::handle(const json& message) {
    if (message.is_array()) {
        if (message.empty()) {
            return make_error(json(), kInvalidRequest, "Invalid Request: empty batch");
        }
        json responses = json::array();
        for (const auto& item : message) {
            auto response = handle_single(item);
            if (response.has_value()) {
                responses.push_back(std::move(response.value()));
            }
        }
        if (responses.empty()) {
            return std::nullopt;
        }
        return responses;
    }
    return handle_single(message);
}

std::optional<json> JsonRpcSession::handle_single(const json& request) {
    if (!request.is_object()) {
        return make_error(json(), kInvalidRequest, "Invalid Request: expected an object");
    }

    const json id = request.value("id", json());
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return make_error(id, kInvalidRequest, "Invalid Request: missing jsonrpc 2.0");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        return make_error(id, kInvalidRequest, "Invalid Request: missing method");
    }

    const std::string method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());
    // Notification (no id): process but never respond
    const bool is_notification = !request.contains("id");

    if (method == "notifications/initialized") {
        if (state_ == ChannelState::Initialized) {
            state_ = ChannelState::Ready;
            LOG_INFO("JsonRpcSession[" + options_.channel + "]: client ready");
        }
        return std::nullopt;
    }
    if (method.rfind("notifications/", 0) == 0) {
        LOG_DEBUG("JsonRpcSession[" + options_.channel + "]: ignoring " + method);
        return std::nullopt;
    }

    json result;
    try {
        if (method == "initialize") {
            result = handle_initialize(params);
        } else if (method == "ping") {
            result = json::object();
        } else if (method == "shutdown") {
            state_ = ChannelState::Closing;
            result = json::object();
        } else if (method == "tools/list" || method == "tools/call") {
            if (state_ == ChannelState::AwaitingInitialize) {
                if (is_notification) return std::nullopt;
                return make_error(id, kServerNotInitialized, "Server not initialized");
            }
            if (method == "tools/list") {
                result = handle_tools_list();
            } else {
                if (!params.is_object() || !params.contains("name") ||
                    !params["name"].is_string()) {
                    if (is_notification) return std::nullopt;
                    return make_error(id, kInvalidParams, "Invalid params: missing tool name");
                }
                result = handle_tools_call(params);
            }
        } else {
            if (is_notification) return std::nullopt;
            return make_error(id, kMethodNotFound, "Method not found: " + method);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("JsonRpcSession[" + options_.channel + "]: " + method + " failed: " +
                  e.what());
        if (is_notification) return std::nullopt;
        return make_error(id, kInternalError, std::string("Internal error: ") + e.what());
    }

    if (is_notification) {
        return std::nullopt;
    }
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

json JsonRpcSession::handle_initialize(const json& params) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        client_name_ = params["clientInfo"].value("name", "");
    }
    if (state_ == ChannelState::AwaitingInitialize) {
        state_ = ChannelState::Initialized;
    }
    LOG_INFO("JsonRpcSession[" + options_.channel + "]: initialize from " +
             (client_name_.empty() ? std::string("unnamed client") : client_name_));

    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", kServerName},
            {"version", kServerVersion}
        }}
    };
}

json JsonRpcSession::handle_tools_list() const {
    return dispatch_->catalog().to_list_json();
}

json JsonRpcSession::handle_tools_call(const json& params) const {
    ToolRequest request;
    request.name = params["name"].get<std::string>();
    request.arguments = params.value("arguments", json::object());

    const ToolResult result = dispatch_->invoke(request);
    EnvelopeOptions envelope_options;
    envelope_options.include_traceback = options_.include_traceback;
    const json envelope = to_envelope(result, envelope_options);

    return {
        {"content", json::array({
            {{"type", "text"},
             {"text", envelope.dump(-1, ' ', false, json::error_handler_t::replace)}}
        })},
        {"isError", !result.success}
    };
}

}  // namespace draftline::protocol
