#include "dispatch/argument_binder.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace draftline::dispatch {

using core::errors::ErrorKind;
using core::errors::make_error;
using nlohmann::json;
using protocol::ParamType;

namespace {

// Integral JSON number that fits in an int; integral floats such as 720.0 count.
bool fits_int(const json& value) {
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(kMax);
    }
    if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        return number >= kMin && number <= kMax;
    }
    if (!value.is_number_float()) {
        return false;
    }
    const double number = value.get<double>();
    return std::isfinite(number) && std::floor(number) == number &&
           number >= static_cast<double>(kMin) && number <= static_cast<double>(kMax);
}

bool matches_type(const json& value, const ParamType type) {
    switch (type) {
        case ParamType::String:
            return value.is_string();
        case ParamType::Integer:
            return fits_int(value);
        case ParamType::Number:
            return value.is_number();
        case ParamType::Boolean:
            return value.is_boolean();
        case ParamType::Array:
            return value.is_array();
        default:
            return false;
    }
}

bool has_value(const json& object, const std::string& key) {
    auto it = object.find(key);
    return it != object.end() && !it->is_null();
}

double number_at(const json& merged, const char* key) {
    return merged.at(key).get<double>();
}

int integer_at(const json& merged, const char* key) {
    const auto& value = merged.at(key);
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    return static_cast<int>(value.get<double>());
}

bool boolean_at(const json& merged, const char* key) {
    return merged.at(key).get<bool>();
}

std::string string_at(const json& merged, const char* key) {
    return merged.at(key).get<std::string>();
}

std::optional<double> optional_number(const json& merged, const char* key) {
    if (!has_value(merged, key)) {
        return std::nullopt;
    }
    return number_at(merged, key);
}

std::optional<int> optional_integer(const json& merged, const char* key) {
    if (!has_value(merged, key)) {
        return std::nullopt;
    }
    return integer_at(merged, key);
}

std::optional<std::string> optional_string(const json& merged, const char* key) {
    if (!has_value(merged, key)) {
        return std::nullopt;
    }
    return string_at(merged, key);
}

json array_or_empty(const json& merged, const char* key) {
    if (!has_value(merged, key)) {
        return json::array();
    }
    return merged.at(key);
}

}  // namespace

core::errors::Result<json> validate_arguments(const protocol::ToolDescriptor& tool,
                                              const json& arguments) {
    if (arguments.is_null()) {
        return validate_arguments(tool, json::object());
    }
    if (!arguments.is_object()) {
        return make_error(ErrorKind::InvalidArgument,
                          "Tool arguments must be a JSON object");
    }

    for (const auto& param : tool.params) {
        if (param.required && !has_value(arguments, param.name)) {
            return make_error(ErrorKind::MissingRequiredArgument,
                              "Missing required argument: " + param.name);
        }
    }

    for (const auto& param : tool.params) {
        if (param.name == "draft_id" || !has_value(arguments, param.name)) {
            continue;
        }
        if (!matches_type(arguments.at(param.name), param.type)) {
            return make_error(ErrorKind::InvalidArgument,
                              "Invalid type for argument " + param.name + ": expected " +
                                  protocol::to_string(param.type));
        }
    }

    return arguments;
}

json merge_arguments(const protocol::ToolDescriptor& tool, const json& arguments,
                     const session::DraftSession* session) {
    json merged = json::object();
    for (const auto& param : tool.params) {
        if (has_value(arguments, param.name)) {
            merged[param.name] = arguments.at(param.name);
        } else if (session != nullptr && param.name == "width") {
            merged[param.name] = session->width;
        } else if (session != nullptr && param.name == "height") {
            merged[param.name] = session->height;
        } else if (!param.default_value.is_null()) {
            merged[param.name] = param.default_value;
        }
    }

    // Tools without canvas parameters in their schema (add_text) still
    // render against the session's canvas unless the caller passes one.
    if (session != nullptr) {
        for (const char* key : {"width", "height"}) {
            if (merged.contains(key)) {
                continue;
            }
            if (has_value(arguments, key) && fits_int(arguments.at(key))) {
                merged[key] = arguments.at(key);
            } else {
                merged[key] = std::string(key) == "width" ? session->width : session->height;
            }
        }
    }
    return merged;
}

composer::VideoClip to_video_clip(const json& merged) {
    composer::VideoClip clip;
    clip.video_url = string_at(merged, "video_url");
    clip.start = number_at(merged, "start");
    clip.end = optional_number(merged, "end");
    clip.target_start = number_at(merged, "target_start");
    clip.width = integer_at(merged, "width");
    clip.height = integer_at(merged, "height");
    clip.transform_x = number_at(merged, "transform_x");
    clip.transform_y = number_at(merged, "transform_y");
    clip.scale_x = number_at(merged, "scale_x");
    clip.scale_y = number_at(merged, "scale_y");
    clip.speed = number_at(merged, "speed");
    clip.track_name = string_at(merged, "track_name");
    clip.volume = number_at(merged, "volume");
    clip.transition = optional_string(merged, "transition");
    clip.transition_duration = number_at(merged, "transition_duration");
    clip.mask_type = optional_string(merged, "mask_type");
    clip.background_blur = optional_integer(merged, "background_blur");
    return clip;
}

composer::AudioClip to_audio_clip(const json& merged) {
    composer::AudioClip clip;
    clip.audio_url = string_at(merged, "audio_url");
    clip.start = number_at(merged, "start");
    clip.end = optional_number(merged, "end");
    clip.target_start = number_at(merged, "target_start");
    clip.volume = number_at(merged, "volume");
    clip.speed = number_at(merged, "speed");
    clip.track_name = string_at(merged, "track_name");
    clip.width = integer_at(merged, "width");
    clip.height = integer_at(merged, "height");
    return clip;
}

composer::ImageClip to_image_clip(const json& merged) {
    composer::ImageClip clip;
    clip.image_url = string_at(merged, "image_url");
    clip.start = number_at(merged, "start");
    clip.duration = number_at(merged, "end") - clip.start;
    clip.width = integer_at(merged, "width");
    clip.height = integer_at(merged, "height");
    clip.transform_x = number_at(merged, "transform_x");
    clip.transform_y = number_at(merged, "transform_y");
    clip.scale_x = number_at(merged, "scale_x");
    clip.scale_y = number_at(merged, "scale_y");
    clip.track_name = string_at(merged, "track_name");
    clip.intro_animation = optional_string(merged, "intro_animation");
    clip.outro_animation = optional_string(merged, "outro_animation");
    clip.transition = optional_string(merged, "transition");
    clip.mask_type = optional_string(merged, "mask_type");
    return clip;
}

composer::TextClip to_text_clip(const json& merged) {
    composer::TextClip clip;
    clip.text = string_at(merged, "text");
    clip.start = number_at(merged, "start");
    clip.duration = number_at(merged, "end") - clip.start;
    clip.font_color = string_at(merged, "font_color");
    clip.font_size = integer_at(merged, "font_size");
    clip.track_name = "text_main";  // add_text always writes to its own track
    clip.width = optional_integer(merged, "width").value_or(clip.width);
    clip.height = optional_integer(merged, "height").value_or(clip.height);

    clip.text_styles = array_or_empty(merged, "text_styles");
    clip.shadow_enabled = boolean_at(merged, "shadow_enabled");
    clip.shadow_color = string_at(merged, "shadow_color");
    clip.shadow_alpha = number_at(merged, "shadow_alpha");
    clip.shadow_angle = number_at(merged, "shadow_angle");
    clip.shadow_distance = number_at(merged, "shadow_distance");
    clip.shadow_smoothing = number_at(merged, "shadow_smoothing");
    clip.background_color = optional_string(merged, "background_color");
    clip.background_alpha = number_at(merged, "background_alpha");
    clip.background_style = integer_at(merged, "background_style");
    clip.background_round_radius = number_at(merged, "background_round_radius");
    return clip;
}

composer::SubtitleImport to_subtitle_import(const json& merged) {
    composer::SubtitleImport subtitle;
    subtitle.srt_path = string_at(merged, "srt_path");
    subtitle.track_name = string_at(merged, "track_name");
    subtitle.time_offset = number_at(merged, "time_offset");
    subtitle.font = optional_string(merged, "font");
    subtitle.font_size = number_at(merged, "font_size");
    subtitle.font_color = string_at(merged, "font_color");
    subtitle.bold = boolean_at(merged, "bold");
    subtitle.italic = boolean_at(merged, "italic");
    subtitle.underline = boolean_at(merged, "underline");
    subtitle.border_width = number_at(merged, "border_width");
    subtitle.border_color = string_at(merged, "border_color");
    subtitle.background_color = string_at(merged, "background_color");
    subtitle.background_alpha = number_at(merged, "background_alpha");
    subtitle.transform_x = number_at(merged, "transform_x");
    subtitle.transform_y = number_at(merged, "transform_y");
    subtitle.width = integer_at(merged, "width");
    subtitle.height = integer_at(merged, "height");
    return subtitle;
}

composer::EffectClip to_effect_clip(const json& merged) {
    composer::EffectClip clip;
    clip.effect_type = string_at(merged, "effect_type");
    clip.start = number_at(merged, "start");
    clip.duration = number_at(merged, "end") - clip.start;
    clip.track_name = string_at(merged, "track_name");
    clip.params = array_or_empty(merged, "params");
    clip.width = integer_at(merged, "width");
    clip.height = integer_at(merged, "height");
    return clip;
}

composer::StickerClip to_sticker_clip(const json& merged) {
    composer::StickerClip clip;
    clip.sticker_url = string_at(merged, "sticker_url");
    clip.start = number_at(merged, "start");
    clip.duration = number_at(merged, "end") - clip.start;
    clip.width = integer_at(merged, "width");
    clip.height = integer_at(merged, "height");
    clip.transform_x = number_at(merged, "transform_x");
    clip.transform_y = number_at(merged, "transform_y");
    clip.scale_x = number_at(merged, "scale_x");
    clip.scale_y = number_at(merged, "scale_y");
    clip.rotation = number_at(merged, "rotation");
    clip.track_name = string_at(merged, "track_name");
    return clip;
}

}  // namespace draftline::dispatch
