#include "transport/sse_channel.hpp"

#include <sstream>
#include <utility>
#include "core/config/draft_id.hpp"
#include "core/logging/logger.hpp"

namespace draftline::transport {

using nlohmann::json;

std::string format_sse_event(const std::string& event, const std::string& data) {
    std::string frame = "event: " + event + "\n";
    std::istringstream in(data);
    std::string line;
    bool wrote_data = false;
    while (std::getline(in, line)) {
        frame += "data: " + line + "\n";
        wrote_data = true;
    }
    if (!wrote_data) {
        frame += "data: \n";
    }
    frame += "\n";
    return frame;
}

SseChannel::SseChannel(std::string id, std::shared_ptr<const dispatch::DispatchCore> dispatch,
                       const bool include_traceback, const std::size_t inbox_capacity)
    : id_(std::move(id)),
      session_(std::move(dispatch), protocol::SessionOptions{"sse:" + id_, include_traceback}),
      inbox_capacity_(inbox_capacity) {}

PostOutcome SseChannel::post(json message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return PostOutcome::Closed;
        }
        if (inbox_.size() >= inbox_capacity_) {
            return PostOutcome::Full;
        }
        inbox_.push_back(std::move(message));
    }
    cv_.notify_one();
    return PostOutcome::Queued;
}

std::optional<json> SseChannel::next(const std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return closed_ || !inbox_.empty(); });
    if (closed_ || inbox_.empty()) {
        return std::nullopt;
    }
    json message = std::move(inbox_.front());
    inbox_.pop_front();
    return message;
}

std::optional<json> SseChannel::process(const json& message) {
    return session_.handle(message);
}

void SseChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        inbox_.clear();
    }
    cv_.notify_all();
}

bool SseChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t SseChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inbox_.size();
}

std::shared_ptr<SseChannel> SseChannelHub::open(
    std::shared_ptr<const dispatch::DispatchCore> dispatch, const bool include_traceback,
    const std::size_t inbox_capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string channel_id = core::config::generate_channel_id();
    while (channels_.find(channel_id) != channels_.end()) {
        channel_id = core::config::generate_channel_id();
    }

    auto channel =
        std::make_shared<SseChannel>(channel_id, std::move(dispatch), include_traceback,
                                     inbox_capacity);
    channels_.emplace(channel_id, channel);
    LOG_INFO("SseChannelHub: channel " + channel_id + " opened (" +
             std::to_string(channels_.size()) + " active)");
    return channel;
}

std::shared_ptr<SseChannel> SseChannelHub::find(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(channel_id);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second;
}

void SseChannelHub::close(const std::string& channel_id) {
    std::shared_ptr<SseChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(channel_id);
        if (it == channels_.end()) {
            return;
        }
        channel = it->second;
        channels_.erase(it);
    }
    channel->close();
    LOG_INFO("SseChannelHub: channel " + channel_id + " closed");
}

void SseChannelHub::close_all() {
    std::unordered_map<std::string, std::shared_ptr<SseChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        channels.swap(channels_);
    }
    for (auto& entry : channels) {
        entry.second->close();
    }
}

std::size_t SseChannelHub::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_.size();
}

}  // namespace draftline::transport
