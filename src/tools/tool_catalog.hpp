#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace draftline::tools {

inline constexpr const char* kCreateDraft = "create_draft";
inline constexpr const char* kAddVideo = "add_video";
inline constexpr const char* kAddAudio = "add_audio";
inline constexpr const char* kAddImage = "add_image";
inline constexpr const char* kAddText = "add_text";
inline constexpr const char* kAddSubtitle = "add_subtitle";
inline constexpr const char* kAddEffect = "add_effect";
inline constexpr const char* kAddSticker = "add_sticker";
inline constexpr const char* kSaveDraft = "save_draft";

// Immutable list of the tools this server exposes. Both transports and the
// dispatch core read the same instance.
class ToolCatalog {
public:
    static const ToolCatalog& builtin();

    explicit ToolCatalog(std::vector<protocol::ToolDescriptor> tools);

    const std::vector<protocol::ToolDescriptor>& list_tools() const;
    const protocol::ToolDescriptor* find(const std::string& name) const;

    // JSON Schema object for one tool ("type", "properties", "required")
    static nlohmann::json input_schema(const protocol::ToolDescriptor& tool);

    // {"tools": [{"name", "description", "inputSchema"}, ...]}
    nlohmann::json to_list_json() const;

private:
    std::vector<protocol::ToolDescriptor> tools_;
};

}  // namespace draftline::tools
