#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "composer/composer.hpp"
#include "core/errors/draft_errors.hpp"

namespace draftline::session {

enum class DraftState {
    New,
    Composing,
    Saved
};

std::string to_string(DraftState state);

struct DraftSession {
    std::string id;
    std::string draft_folder;
    int width = 1080;
    int height = 1920;
    DraftState state = DraftState::New;
};

// Exclusive ownership of one draft for the length of a composer call.
// Unlike std::mutex it may be released by a thread other than the one that
// acquired it, so a timed-out caller can leave the release to its worker.
class DraftGate {
public:
    void acquire();
    bool try_acquire_for(std::chrono::milliseconds wait);
    void release();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
};

class DraftRegistry {
public:
    // Materializes a backing folder through the composer and stores the
    // session as New. Nothing is inserted if the composer fails.
    core::errors::Result<DraftSession> create(int width, int height,
                                              composer::Composer& composer);

    core::errors::Result<DraftSession> get(const std::string& draft_id) const;

    // Forward-only: New -> Composing -> Saved, New -> Saved. Requesting the
    // current state succeeds without change.
    core::errors::Result<DraftState> advance_state(const std::string& draft_id,
                                                   DraftState next_state);

    // Exclusion held across every composer call that mutates the draft.
    core::errors::Result<std::shared_ptr<DraftGate>> mutation_lock(
        const std::string& draft_id) const;

    std::size_t size() const;

private:
    struct DraftRecord {
        DraftSession session;
        std::shared_ptr<DraftGate> mutation_gate = std::make_shared<DraftGate>();
    };

    static bool is_allowed(DraftState from, DraftState to);
    core::errors::Result<std::string> reserve_id();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DraftRecord> drafts_;
    std::unordered_set<std::string> issued_ids_;
};

}  // namespace draftline::session
