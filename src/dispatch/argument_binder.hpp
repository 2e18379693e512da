#pragma once

#include <nlohmann/json.hpp>
#include "composer/composer.hpp"
#include "core/errors/draft_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "session/draft_registry.hpp"

namespace draftline::dispatch {

// Checks the caller's arguments against the tool's schema: arguments must be
// an object, every required field present and non-null, every supplied field
// of the declared type. draft_id is left to the registry lookup. Returns the
// arguments object (null is treated as {}).
core::errors::Result<nlohmann::json> validate_arguments(
    const protocol::ToolDescriptor& tool, const nlohmann::json& arguments);

// Caller value, then the session's canvas size for width/height, then the
// catalog default. Parameters without any value are left out.
nlohmann::json merge_arguments(const protocol::ToolDescriptor& tool,
                               const nlohmann::json& arguments,
                               const session::DraftSession* session);

// Builders expect merged, validated arguments. Timed clips without a
// duration parameter get duration = end - start, sign and zero preserved.
composer::VideoClip to_video_clip(const nlohmann::json& merged);
composer::AudioClip to_audio_clip(const nlohmann::json& merged);
composer::ImageClip to_image_clip(const nlohmann::json& merged);
composer::TextClip to_text_clip(const nlohmann::json& merged);
composer::SubtitleImport to_subtitle_import(const nlohmann::json& merged);
composer::EffectClip to_effect_clip(const nlohmann::json& merged);
composer::StickerClip to_sticker_clip(const nlohmann::json& merged);

}  // namespace draftline::dispatch
