#include "tools/tool_catalog.hpp"

#include <utility>

namespace draftline::tools {

using nlohmann::json;
using protocol::ParamSpec;
using protocol::ParamType;
using protocol::ToolDescriptor;

namespace {

ParamSpec required(const std::string& name, const ParamType type,
                   const std::string& description) {
    return ParamSpec{name, type, description, nullptr, true};
}

ParamSpec optional(const std::string& name, const ParamType type,
                   const std::string& description) {
    return ParamSpec{name, type, description, nullptr, false};
}

ParamSpec with_default(const std::string& name, const ParamType type,
                       const std::string& description, json default_value) {
    return ParamSpec{name, type, description, std::move(default_value), false};
}

ParamSpec draft_id_param() {
    return optional("draft_id", ParamType::String, "Draft ID");
}

std::vector<ToolDescriptor> make_builtin_tools() {
    std::vector<ToolDescriptor> tools;

    tools.push_back(ToolDescriptor{
        kCreateDraft,
        "Create a new draft",
        {
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
        }});

    tools.push_back(ToolDescriptor{
        kAddVideo,
        "Add a video to the draft, with transition, mask and background blur support",
        {
            required("video_url", ParamType::String, "Video URL"),
            draft_id_param(),
            with_default("start", ParamType::Number, "Source start time (seconds)", 0),
            optional("end", ParamType::Number, "Source end time (seconds)"),
            with_default("target_start", ParamType::Number,
                         "Start time on the timeline (seconds)", 0),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
            with_default("transform_x", ParamType::Number, "X position", 0),
            with_default("transform_y", ParamType::Number, "Y position", 0),
            with_default("scale_x", ParamType::Number, "X scale", 1),
            with_default("scale_y", ParamType::Number, "Y scale", 1),
            with_default("speed", ParamType::Number, "Playback speed", 1.0),
            with_default("track_name", ParamType::String, "Track name", "main"),
            with_default("volume", ParamType::Number, "Volume", 1.0),
            optional("transition", ParamType::String, "Transition type"),
            with_default("transition_duration", ParamType::Number,
                         "Transition duration (seconds)", 0.5),
            optional("mask_type", ParamType::String, "Mask type"),
            optional("background_blur", ParamType::Integer, "Background blur level (1-4)"),
        }});

    tools.push_back(ToolDescriptor{
        kAddAudio,
        "Add an audio clip to the draft",
        {
            required("audio_url", ParamType::String, "Audio URL"),
            draft_id_param(),
            with_default("start", ParamType::Number, "Source start time (seconds)", 0),
            optional("end", ParamType::Number, "Source end time (seconds)"),
            with_default("target_start", ParamType::Number,
                         "Start time on the timeline (seconds)", 0),
            with_default("volume", ParamType::Number, "Volume", 1.0),
            with_default("speed", ParamType::Number, "Playback speed", 1.0),
            with_default("track_name", ParamType::String, "Track name", "audio_main"),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
        }});

    tools.push_back(ToolDescriptor{
        kAddImage,
        "Add an image to the draft, with animation, transition and mask support",
        {
            required("image_url", ParamType::String, "Image URL"),
            draft_id_param(),
            with_default("start", ParamType::Number, "Start time (seconds)", 0),
            with_default("end", ParamType::Number, "End time (seconds)", 3.0),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
            with_default("transform_x", ParamType::Number, "X position", 0),
            with_default("transform_y", ParamType::Number, "Y position", 0),
            with_default("scale_x", ParamType::Number, "X scale", 1),
            with_default("scale_y", ParamType::Number, "Y scale", 1),
            with_default("track_name", ParamType::String, "Track name", "main"),
            optional("intro_animation", ParamType::String, "Intro animation"),
            optional("outro_animation", ParamType::String, "Outro animation"),
            optional("transition", ParamType::String, "Transition type"),
            optional("mask_type", ParamType::String, "Mask type"),
        }});

    tools.push_back(ToolDescriptor{
        kAddText,
        "Add text to the draft, with multi-style ranges, shadow and background",
        {
            required("text", ParamType::String, "Text content"),
            required("start", ParamType::Number, "Start time (seconds)"),
            required("end", ParamType::Number, "End time (seconds)"),
            draft_id_param(),
            with_default("font_color", ParamType::String, "Font color", "#ffffff"),
            with_default("font_size", ParamType::Integer, "Font size", 24),
            with_default("shadow_enabled", ParamType::Boolean, "Enable text shadow", false),
            with_default("shadow_color", ParamType::String, "Shadow color", "#000000"),
            with_default("shadow_alpha", ParamType::Number, "Shadow alpha", 0.8),
            with_default("shadow_angle", ParamType::Number, "Shadow angle", 315.0),
            with_default("shadow_distance", ParamType::Number, "Shadow distance", 5.0),
            with_default("shadow_smoothing", ParamType::Number, "Shadow smoothing", 0.0),
            optional("background_color", ParamType::String, "Background color"),
            with_default("background_alpha", ParamType::Number, "Background alpha", 1.0),
            with_default("background_style", ParamType::Integer, "Background style", 0),
            with_default("background_round_radius", ParamType::Number,
                         "Background corner radius", 0.0),
            optional("text_styles", ParamType::Array, "Per-range text style list"),
        }});

    tools.push_back(ToolDescriptor{
        kAddSubtitle,
        "Add subtitles from an SRT file to the draft",
        {
            required("srt_path", ParamType::String, "SRT file path or URL"),
            draft_id_param(),
            with_default("track_name", ParamType::String, "Track name", "subtitle"),
            with_default("time_offset", ParamType::Number, "Time offset (seconds)", 0),
            optional("font", ParamType::String, "Font"),
            with_default("font_size", ParamType::Number, "Font size", 8.0),
            with_default("font_color", ParamType::String, "Font color", "#FFFFFF"),
            with_default("bold", ParamType::Boolean, "Bold", false),
            with_default("italic", ParamType::Boolean, "Italic", false),
            with_default("underline", ParamType::Boolean, "Underline", false),
            with_default("border_width", ParamType::Number, "Border width", 0.0),
            with_default("border_color", ParamType::String, "Border color", "#000000"),
            with_default("background_color", ParamType::String, "Background color", "#000000"),
            with_default("background_alpha", ParamType::Number, "Background alpha", 0.0),
            with_default("transform_x", ParamType::Number, "X position", 0.0),
            with_default("transform_y", ParamType::Number, "Y position", -0.8),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
        }});

    tools.push_back(ToolDescriptor{
        kAddEffect,
        "Add an effect to the draft",
        {
            required("effect_type", ParamType::String, "Effect type name"),
            draft_id_param(),
            with_default("start", ParamType::Number, "Start time (seconds)", 0),
            with_default("end", ParamType::Number, "End time (seconds)", 3.0),
            with_default("track_name", ParamType::String, "Track name", "effect_01"),
            optional("params", ParamType::Array, "Effect parameter list"),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
        }});

    tools.push_back(ToolDescriptor{
        kAddSticker,
        "Add a sticker to the draft",
        {
            required("sticker_url", ParamType::String, "Sticker URL"),
            draft_id_param(),
            with_default("start", ParamType::Number, "Start time (seconds)", 0),
            with_default("end", ParamType::Number, "End time (seconds)", 3.0),
            with_default("width", ParamType::Integer, "Canvas width", 1080),
            with_default("height", ParamType::Integer, "Canvas height", 1920),
            with_default("transform_x", ParamType::Number, "X position", 0),
            with_default("transform_y", ParamType::Number, "Y position", 0),
            with_default("scale_x", ParamType::Number, "X scale", 1),
            with_default("scale_y", ParamType::Number, "Y scale", 1),
            with_default("rotation", ParamType::Number, "Rotation (degrees)", 0),
            with_default("track_name", ParamType::String, "Track name", "sticker_main"),
        }});

    tools.push_back(ToolDescriptor{
        kSaveDraft,
        "Save the draft and produce the final project",
        {
            required("draft_id", ParamType::String, "Draft ID"),
        }});

    return tools;
}

}  // namespace

const ToolCatalog& ToolCatalog::builtin() {
    static const ToolCatalog catalog(make_builtin_tools());
    return catalog;
}

ToolCatalog::ToolCatalog(std::vector<ToolDescriptor> tools)
    : tools_(std::move(tools)) {}

const std::vector<ToolDescriptor>& ToolCatalog::list_tools() const {
    return tools_;
}

const ToolDescriptor* ToolCatalog::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

json ToolCatalog::input_schema(const ToolDescriptor& tool) {
    json properties = json::object();
    json required_fields = json::array();
    for (const auto& param : tool.params) {
        json property;
        property["type"] = protocol::to_string(param.type);
        property["description"] = param.description;
        if (!param.default_value.is_null()) {
            property["default"] = param.default_value;
        }
        properties[param.name] = std::move(property);
        if (param.required) {
            required_fields.push_back(param.name);
        }
    }

    json schema;
    schema["type"] = "object";
    schema["properties"] = std::move(properties);
    if (!required_fields.empty()) {
        schema["required"] = std::move(required_fields);
    }
    return schema;
}

json ToolCatalog::to_list_json() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        list.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", input_schema(tool)},
        });
    }
    return {{"tools", list}};
}

}  // namespace draftline::tools
