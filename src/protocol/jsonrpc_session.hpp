#pragma once

#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "dispatch/dispatch_core.hpp"

namespace draftline::protocol {

inline constexpr const char* kProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "draftline";
inline constexpr const char* kServerVersion = "1.0.0";

// JSON-RPC 2.0 error codes used on the wire
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kServerNotInitialized = -32002;

enum class ChannelState {
    AwaitingInitialize,  // Only initialize/ping are served
    Initialized,         // initialize answered, waiting for notifications/initialized
    Ready,
    Closing              // shutdown requested; the transport should stop reading
};

struct SessionOptions {
    std::string channel = "stdio";
    bool include_traceback = true;
};

// One client's view of the MCP method surface. Owned by exactly one channel
// and driven sequentially; the dispatch core behind it is shared.
class JsonRpcSession {
public:
    JsonRpcSession(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                   SessionOptions options);

    // Handles one decoded message (object or batch array). Returns the
    // response to send, or nullopt for notifications.
    std::optional<nlohmann::json> handle(const nlohmann::json& message);

    ChannelState state() const { return state_; }
    bool should_close() const { return state_ == ChannelState::Closing; }
    const SessionOptions& options() const { return options_; }

    static nlohmann::json make_error(const nlohmann::json& id, int code,
                                     const std::string& message);

private:
    std::optional<nlohmann::json> handle_single(const nlohmann::json& request);
    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_tools_list() const;
    nlohmann::json handle_tools_call(const nlohmann::json& params) const;

    std::shared_ptr<const dispatch::DispatchCore> dispatch_;
    SessionOptions options_;
    ChannelState state_ = ChannelState::AwaitingInitialize;
    std::string client_name_;
};

}  // namespace draftline::protocol
