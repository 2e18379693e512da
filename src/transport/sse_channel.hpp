#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "dispatch/dispatch_core.hpp"
#include "protocol/jsonrpc_session.hpp"

namespace draftline::transport {

// Formats one Server-Sent Events frame; multi-line data becomes several data: lines.
std::string format_sse_event(const std::string& event, const std::string& data);

constexpr std::size_t kDefaultInboxCapacity = 64;

enum class PostOutcome {
    Queued,
    Full,
    Closed
};

// One GET /sse client. POST /messages pushes into the inbox; the stream's
// own thread pops and processes in arrival order, so a channel never has
// two requests in flight.
class SseChannel {
public:
    SseChannel(std::string id, std::shared_ptr<const dispatch::DispatchCore> dispatch,
               bool include_traceback, std::size_t inbox_capacity = kDefaultInboxCapacity);

    const std::string& id() const { return id_; }

    // Queues a message unless the inbox is at capacity or the channel is closed.
    PostOutcome post(nlohmann::json message);

    // Waits up to `wait` for the next queued message. nullopt on timeout or close.
    std::optional<nlohmann::json> next(std::chrono::milliseconds wait);

    // Runs one message through this channel's JSON-RPC session. Stream thread only.
    std::optional<nlohmann::json> process(const nlohmann::json& message);
    bool should_close() const { return session_.should_close(); }

    void close();
    bool closed() const;
    std::size_t pending() const;

private:
    std::string id_;
    protocol::JsonRpcSession session_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> inbox_;
    std::size_t inbox_capacity_;
    bool closed_ = false;
};

class SseChannelHub {
public:
    std::shared_ptr<SseChannel> open(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                                     bool include_traceback,
                                     std::size_t inbox_capacity = kDefaultInboxCapacity);
    std::shared_ptr<SseChannel> find(const std::string& channel_id) const;
    void close(const std::string& channel_id);
    void close_all();
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<SseChannel>> channels_;
};

}  // namespace draftline::transport
