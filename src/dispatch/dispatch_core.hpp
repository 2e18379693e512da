#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "composer/composer.hpp"
#include "core/errors/draft_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/draft_registry.hpp"
#include "tools/tool_catalog.hpp"

namespace draftline::dispatch {

struct DispatchOptions {
    // Upper bound on one composer mutation; 0 waits indefinitely.
    std::uint32_t composer_timeout_ms = 0;
};

// Composer calls still running on timeout workers.
class MutationWorkers;

// Validates tool calls against the catalog, resolves the draft, calls the
// composer and wraps every outcome in a ToolResult. Shared by all transports;
// safe to call from many threads at once.
class DispatchCore {
public:
    DispatchCore(std::shared_ptr<session::DraftRegistry> registry,
                 std::shared_ptr<composer::Composer> composer,
                 DispatchOptions options = {},
                 const tools::ToolCatalog& catalog = tools::ToolCatalog::builtin());
    // Waits for timed-out composer calls that are still running.
    ~DispatchCore();

    const std::vector<protocol::ToolDescriptor>& list_tools() const;
    const tools::ToolCatalog& catalog() const { return catalog_; }

    // Never throws: every failure becomes a failed ToolResult.
    protocol::ToolResult invoke(const protocol::ToolRequest& request) const noexcept;

    // Timeout workers whose composer call has not returned yet.
    std::size_t running_workers() const;

private:
    using ComposerCall =
        std::function<nlohmann::json(composer::Composer&, const std::string& draft_folder)>;

    protocol::ToolResult dispatch(const protocol::ToolRequest& request) const;
    protocol::ToolResult create_draft(const protocol::ToolDescriptor& tool,
                                      const nlohmann::json& arguments) const;
    protocol::ToolResult mutate_draft(const protocol::ToolDescriptor& tool,
                                      const nlohmann::json& arguments) const;

    core::errors::Result<nlohmann::json> run_mutation(const session::DraftSession& draft,
                                                      const std::string& tool_name,
                                                      ComposerCall call,
                                                      session::DraftState next_state) const;

    static core::errors::Result<ComposerCall> bind_call(const std::string& tool_name,
                                                        const nlohmann::json& merged);

    std::shared_ptr<session::DraftRegistry> registry_;
    std::shared_ptr<composer::Composer> composer_;
    DispatchOptions options_;
    const tools::ToolCatalog& catalog_;
    std::shared_ptr<MutationWorkers> workers_;
};

}  // namespace draftline::dispatch
