#include "session/draft_registry.hpp"

#include <exception>
#include <utility>
#include "core/config/draft_id.hpp"
#include "core/logging/logger.hpp"

namespace draftline::session {

using core::errors::ErrorKind;
using core::errors::make_error;

std::string to_string(const DraftState state) {
    switch (state) {
        case DraftState::New:
            return "new";
        case DraftState::Composing:
            return "composing";
        case DraftState::Saved:
            return "saved";
        default:
            return "unknown";
    }
}

void DraftGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !held_; });
    held_ = true;
}

bool DraftGate::try_acquire_for(const std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, wait, [this] { return !held_; })) {
        return false;
    }
    held_ = true;
    return true;
}

void DraftGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
    }
    cv_.notify_one();
}

bool DraftRegistry::is_allowed(const DraftState from, const DraftState to) {
    switch (from) {
        case DraftState::New:
            return to == DraftState::Composing || to == DraftState::Saved;
        case DraftState::Composing:
            return to == DraftState::Saved;
        case DraftState::Saved:
        default:
            return false;
    }
}

core::errors::Result<std::string> DraftRegistry::reserve_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::string draft_id = core::config::generate_draft_id();
        if (issued_ids_.insert(draft_id).second) {
            return draft_id;
        }
    }

    return make_error(ErrorKind::InternalError, "Unable to allocate unique draft ID.");
}

core::errors::Result<DraftSession> DraftRegistry::create(
    const int width, const int height, composer::Composer& composer) {
    auto reserved = reserve_id();
    if (core::errors::is_error(reserved)) {
        return core::errors::get_error(reserved);
    }
    const std::string draft_id = core::errors::get_value(reserved);

    // The id stays reserved even if the composer fails, so it is never handed out twice.
    std::string draft_folder;
    try {
        draft_folder = composer.create_draft(draft_id, width, height);
    } catch (const std::exception& e) {
        LOG_WARN("DraftRegistry: composer failed to create draft " + draft_id + ": " +
                 e.what());
        return make_error(ErrorKind::CompositionBackendError, e.what(),
                          "create_draft(" + draft_id + "): " + e.what());
    } catch (...) {
        LOG_WARN("DraftRegistry: composer failed to create draft " + draft_id +
                 " with a non-standard exception");
        return make_error(ErrorKind::CompositionBackendError,
                          "Composer raised a non-standard exception",
                          "create_draft(" + draft_id + ")");
    }

    DraftRecord record;
    record.session.id = draft_id;
    record.session.draft_folder = draft_folder;
    record.session.width = width;
    record.session.height = height;
    record.session.state = DraftState::New;

    DraftSession created = record.session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drafts_.emplace(draft_id, std::move(record));
    }
    LOG_INFO("DraftRegistry: draft " + draft_id + " created (" + std::to_string(width) +
             "x" + std::to_string(height) + ")");
    return created;
}

core::errors::Result<DraftSession> DraftRegistry::get(const std::string& draft_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drafts_.find(draft_id);
    if (it == drafts_.end()) {
        return make_error(ErrorKind::InvalidDraftId, "Invalid draft_id");
    }
    return it->second.session;
}

core::errors::Result<DraftState> DraftRegistry::advance_state(
    const std::string& draft_id, const DraftState next_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drafts_.find(draft_id);
    if (it == drafts_.end()) {
        return make_error(ErrorKind::InvalidDraftId, "Invalid draft_id");
    }

    const DraftState current = it->second.session.state;
    if (current == next_state) {
        return current;
    }
    if (!is_allowed(current, next_state)) {
        return make_error(ErrorKind::InvalidDraftState,
                          "Draft " + draft_id + " cannot move from " + to_string(current) +
                              " to " + to_string(next_state));
    }

    it->second.session.state = next_state;
    LOG_INFO("DraftRegistry: draft " + draft_id + " transition " + to_string(current) +
             " -> " + to_string(next_state));
    return next_state;
}

core::errors::Result<std::shared_ptr<DraftGate>> DraftRegistry::mutation_lock(
    const std::string& draft_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = drafts_.find(draft_id);
    if (it == drafts_.end()) {
        return make_error(ErrorKind::InvalidDraftId, "Invalid draft_id");
    }
    return it->second.mutation_gate;
}

std::size_t DraftRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return drafts_.size();
}

}  // namespace draftline::session
