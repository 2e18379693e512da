#include "dispatch/dispatch_core.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <typeinfo>
#include <utility>
#include <boost/core/demangle.hpp>
#include "core/logging/logger.hpp"
#include "dispatch/argument_binder.hpp"
#include "protocol/envelope.hpp"

namespace draftline::dispatch {

using core::errors::DraftError;
using core::errors::ErrorKind;
using core::errors::make_error;
using nlohmann::json;
using protocol::ToolDescriptor;
using protocol::ToolRequest;
using protocol::ToolResult;
using session::DraftSession;
using session::DraftState;

class MutationWorkers {
public:
    void started() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++running_;
    }

    void finished() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_;
        }
        idle_.notify_all();
    }

    std::size_t running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return running_ == 0; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::size_t running_ = 0;
};

namespace {

using MutationCall = std::function<json(composer::Composer&, const std::string&)>;

std::string describe_fault(const std::string& tool_name, const std::string& draft_id,
                           const std::exception& e) {
    std::string detail = "tool=" + tool_name;
    if (!draft_id.empty()) {
        detail += " draft_id=" + draft_id;
    }
    detail += "\n" + boost::core::demangle(typeid(e).name()) + ": " + e.what();
    return detail;
}

// Owns an acquired draft gate and releases it on destruction.
class GateHold {
public:
    explicit GateHold(std::shared_ptr<session::DraftGate> gate) : gate_(std::move(gate)) {}
    GateHold(GateHold&& other) noexcept : gate_(std::move(other.gate_)) {}
    GateHold(const GateHold&) = delete;
    GateHold& operator=(const GateHold&) = delete;
    GateHold& operator=(GateHold&&) = delete;
    ~GateHold() { release(); }

    void release() {
        if (gate_) {
            gate_->release();
            gate_.reset();
        }
    }

private:
    std::shared_ptr<session::DraftGate> gate_;
};

// Counts one worker as running until done() or destruction.
class WorkerTicket {
public:
    explicit WorkerTicket(std::shared_ptr<MutationWorkers> workers)
        : workers_(std::move(workers)) {
        workers_->started();
    }
    WorkerTicket(WorkerTicket&& other) noexcept : workers_(std::move(other.workers_)) {}
    WorkerTicket(const WorkerTicket&) = delete;
    WorkerTicket& operator=(const WorkerTicket&) = delete;
    WorkerTicket& operator=(WorkerTicket&&) = delete;
    ~WorkerTicket() { done(); }

    void done() {
        if (workers_) {
            workers_->finished();
            workers_.reset();
        }
    }

private:
    std::shared_ptr<MutationWorkers> workers_;
};

// Runs one composer mutation. The caller holds the draft's gate; the draft
// state is re-read under it so a save that finished while this call was
// waiting is observed.
core::errors::Result<json> execute_locked(session::DraftRegistry& registry,
                                          composer::Composer& composer,
                                          const DraftSession& draft,
                                          const std::string& tool_name,
                                          const MutationCall& call,
                                          const DraftState next_state) {
    auto current = registry.get(draft.id);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    if (core::errors::get_value(current).state == DraftState::Saved) {
        return make_error(ErrorKind::InvalidDraftState,
                          "Draft " + draft.id + " is already saved");
    }

    json value;
    try {
        value = call(composer, draft.draft_folder);
    } catch (const std::exception& e) {
        return make_error(ErrorKind::CompositionBackendError, e.what(),
                          describe_fault(tool_name, draft.id, e));
    } catch (...) {
        return make_error(ErrorKind::CompositionBackendError,
                          "Composer raised a non-standard exception",
                          "tool=" + tool_name + " draft_id=" + draft.id);
    }

    auto advanced = registry.advance_state(draft.id, next_state);
    if (core::errors::is_error(advanced)) {
        return core::errors::get_error(advanced);
    }
    return value;
}

double elapsed_ms(const std::chrono::steady_clock::time_point started) {
    const auto ended = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(ended - started).count();
}

}  // namespace

DispatchCore::DispatchCore(std::shared_ptr<session::DraftRegistry> registry,
                           std::shared_ptr<composer::Composer> composer,
                           DispatchOptions options, const tools::ToolCatalog& catalog)
    : registry_(std::move(registry)),
      composer_(std::move(composer)),
      options_(options),
      catalog_(catalog),
      workers_(std::make_shared<MutationWorkers>()) {}

DispatchCore::~DispatchCore() {
    const std::size_t running = workers_->running();
    if (running > 0) {
        LOG_INFO("Dispatch: waiting for " + std::to_string(running) +
                 " abandoned composer call(s)");
    }
    workers_->wait_idle();
}

std::size_t DispatchCore::running_workers() const {
    return workers_->running();
}

const std::vector<ToolDescriptor>& DispatchCore::list_tools() const {
    return catalog_.list_tools();
}

ToolResult DispatchCore::invoke(const ToolRequest& request) const noexcept {
    const auto started = std::chrono::steady_clock::now();
    ToolResult result;
    try {
        result = dispatch(request);
    } catch (const std::exception& e) {
        result = protocol::make_failure(make_error(ErrorKind::InternalError, e.what(),
                                                   describe_fault(request.name, "", e)));
    } catch (...) {
        result = protocol::make_failure(make_error(ErrorKind::InternalError,
                                                   "Unknown internal error",
                                                   "tool=" + request.name));
    }
    result.duration_ms = elapsed_ms(started);

    if (result.success) {
        LOG_DEBUG("Dispatch: " + request.name + " ok in " +
                  std::to_string(static_cast<long long>(result.duration_ms)) + " ms");
    } else if (result.error.has_value()) {
        LOG_WARN("Dispatch: " + request.name + " failed [" + result.error->code +
                 "]: " + result.error->message);
    }
    return result;
}

ToolResult DispatchCore::dispatch(const ToolRequest& request) const {
    const ToolDescriptor* tool = catalog_.find(request.name);
    if (tool == nullptr) {
        return protocol::make_failure(
            make_error(ErrorKind::UnknownTool, "Unknown tool: " + request.name));
    }

    auto validated = validate_arguments(*tool, request.arguments);
    if (core::errors::is_error(validated)) {
        return protocol::make_failure(core::errors::get_error(validated));
    }
    const json& arguments = core::errors::get_value(validated);

    if (tool->name == tools::kCreateDraft) {
        return create_draft(*tool, arguments);
    }
    return mutate_draft(*tool, arguments);
}

ToolResult DispatchCore::create_draft(const ToolDescriptor& tool,
                                      const json& arguments) const {
    const json merged = merge_arguments(tool, arguments, nullptr);
    const int width = merged.at("width").get<int>();
    const int height = merged.at("height").get<int>();

    auto created = registry_->create(width, height, *composer_);
    if (core::errors::is_error(created)) {
        return protocol::make_failure(core::errors::get_error(created));
    }

    const DraftSession& draft = core::errors::get_value(created);
    json payload;
    payload["draft_id"] = draft.id;
    payload["draft_folder"] = draft.draft_folder;
    payload["width"] = draft.width;
    payload["height"] = draft.height;
    return protocol::make_success(std::move(payload));
}

ToolResult DispatchCore::mutate_draft(const ToolDescriptor& tool,
                                      const json& arguments) const {
    auto draft_id_it = arguments.find("draft_id");
    if (draft_id_it == arguments.end() || !draft_id_it->is_string()) {
        return protocol::make_failure(make_error(ErrorKind::InvalidDraftId, "Invalid draft_id"));
    }

    auto found = registry_->get(draft_id_it->get<std::string>());
    if (core::errors::is_error(found)) {
        return protocol::make_failure(core::errors::get_error(found));
    }
    const DraftSession draft = core::errors::get_value(found);

    const json merged = merge_arguments(tool, arguments, &draft);
    LOG_DEBUG("Dispatch: " + tool.name + " on draft " + draft.id + " args=" + merged.dump());

    auto bound = bind_call(tool.name, merged);
    if (core::errors::is_error(bound)) {
        return protocol::make_failure(core::errors::get_error(bound));
    }

    const DraftState next_state =
        tool.name == tools::kSaveDraft ? DraftState::Saved : DraftState::Composing;
    auto outcome = run_mutation(draft, tool.name, core::errors::get_value(bound), next_state);
    if (core::errors::is_error(outcome)) {
        return protocol::make_failure(core::errors::get_error(outcome));
    }

    json payload;
    payload["draft_id"] = draft.id;
    payload["result"] = core::errors::get_value(outcome);
    return protocol::make_success(std::move(payload));
}

core::errors::Result<json> DispatchCore::run_mutation(const DraftSession& draft,
                                                      const std::string& tool_name,
                                                      ComposerCall call,
                                                      const DraftState next_state) const {
    auto lock_result = registry_->mutation_lock(draft.id);
    if (core::errors::is_error(lock_result)) {
        return core::errors::get_error(lock_result);
    }
    std::shared_ptr<session::DraftGate> gate = core::errors::get_value(lock_result);

    if (options_.composer_timeout_ms == 0) {
        gate->acquire();
        GateHold hold(gate);
        return execute_locked(*registry_, *composer_, draft, tool_name, call, next_state);
    }

    // One deadline covers both the wait for the draft and the composer call.
    const auto timeout = std::chrono::milliseconds(options_.composer_timeout_ms);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto timed_out = [&](const std::string& where) {
        return make_error(ErrorKind::CompositionBackendError,
                          "Composer call timed out after " +
                              std::to_string(options_.composer_timeout_ms) + " ms",
                          "tool=" + tool_name + " draft_id=" + draft.id + " " + where);
    };

    // A draft stuck in an earlier call fails here without spawning anything,
    // so there is at most one worker per draft.
    if (!gate->try_acquire_for(timeout)) {
        return timed_out("waiting for draft");
    }
    GateHold hold(gate);

    // The worker owns the gate and everything it touches, so it can finish
    // (and release the draft) after the caller has given up on it.
    auto promise = std::make_shared<std::promise<core::errors::Result<json>>>();
    auto abandoned = std::make_shared<std::atomic_bool>(false);
    std::future<core::errors::Result<json>> future = promise->get_future();

    std::thread worker([registry = registry_, composer = composer_, draft, tool_name,
                        call = std::move(call), next_state, promise, abandoned,
                        hold = std::move(hold), ticket = WorkerTicket(workers_)]() mutable {
        auto outcome =
            execute_locked(*registry, *composer, draft, tool_name, call, next_state);
        hold.release();
        if (abandoned->load()) {
            LOG_WARN("Dispatch: late " + tool_name + " on draft " + draft.id +
                     (core::errors::is_error(outcome) ? " failed after timeout"
                                                      : " completed after timeout"));
        }
        promise->set_value(std::move(outcome));
        ticket.done();
    });
    worker.detach();

    if (future.wait_until(deadline) == std::future_status::timeout) {
        abandoned->store(true);
        return timed_out("in composer");
    }
    return future.get();
}

core::errors::Result<DispatchCore::ComposerCall> DispatchCore::bind_call(
    const std::string& tool_name, const json& merged) {
    using composer::Composer;

    if (tool_name == tools::kAddVideo) {
        auto clip = to_video_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_video(folder, clip);
        });
    }
    if (tool_name == tools::kAddAudio) {
        auto clip = to_audio_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_audio(folder, clip);
        });
    }
    if (tool_name == tools::kAddImage) {
        auto clip = to_image_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_image(folder, clip);
        });
    }
    if (tool_name == tools::kAddText) {
        auto clip = to_text_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_text(folder, clip);
        });
    }
    if (tool_name == tools::kAddSubtitle) {
        auto subtitle = to_subtitle_import(merged);
        return ComposerCall([subtitle](Composer& c, const std::string& folder) {
            return c.add_subtitle(folder, subtitle);
        });
    }
    if (tool_name == tools::kAddEffect) {
        auto clip = to_effect_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_effect(folder, clip);
        });
    }
    if (tool_name == tools::kAddSticker) {
        auto clip = to_sticker_clip(merged);
        return ComposerCall([clip](Composer& c, const std::string& folder) {
            return c.add_sticker(folder, clip);
        });
    }
    if (tool_name == tools::kSaveDraft) {
        const std::string draft_id = merged.at("draft_id").get<std::string>();
        return ComposerCall([draft_id](Composer& c, const std::string& folder) {
            return c.save_draft(folder, draft_id);
        });
    }

    return make_error(ErrorKind::InternalError,
                      "No composer entry point for tool: " + tool_name);
}

}  // namespace draftline::dispatch
