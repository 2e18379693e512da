#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace draftline::composer {

// Thrown by Composer implementations when a mutation cannot be carried out.
class ComposerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct VideoClip {
    std::string video_url;
    double start = 0.0;
    std::optional<double> end;
    double target_start = 0.0;
    int width = 1080;
    int height = 1920;
    double transform_x = 0.0;
    double transform_y = 0.0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    double speed = 1.0;
    std::string track_name = "main";
    double volume = 1.0;
    std::optional<std::string> transition;
    double transition_duration = 0.5;
    std::optional<std::string> mask_type;
    std::optional<int> background_blur;
};

struct AudioClip {
    std::string audio_url;
    double start = 0.0;
    std::optional<double> end;
    double target_start = 0.0;
    double volume = 1.0;
    double speed = 1.0;
    std::string track_name = "audio_main";
    int width = 1080;
    int height = 1920;
};

struct ImageClip {
    std::string image_url;
    double start = 0.0;
    double duration = 3.0;
    int width = 1080;
    int height = 1920;
    double transform_x = 0.0;
    double transform_y = 0.0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    std::string track_name = "main";
    std::optional<std::string> intro_animation;
    std::optional<std::string> outro_animation;
    std::optional<std::string> transition;
    std::optional<std::string> mask_type;
};

struct TextClip {
    std::string text;
    double start = 0.0;
    double duration = 0.0;
    std::string font_color = "#ffffff";
    int font_size = 24;
    std::string track_name = "text_main";
    int width = 1080;
    int height = 1920;
    nlohmann::json text_styles = nlohmann::json::array();
    bool shadow_enabled = false;
    std::string shadow_color = "#000000";
    double shadow_alpha = 0.8;
    double shadow_angle = 315.0;
    double shadow_distance = 5.0;
    double shadow_smoothing = 0.0;
    std::optional<std::string> background_color;
    double background_alpha = 1.0;
    int background_style = 0;
    double background_round_radius = 0.0;
};

struct SubtitleImport {
    std::string srt_path;
    std::string track_name = "subtitle";
    double time_offset = 0.0;
    std::optional<std::string> font;
    double font_size = 8.0;
    std::string font_color = "#FFFFFF";
    bool bold = false;
    bool italic = false;
    bool underline = false;
    double border_width = 0.0;
    std::string border_color = "#000000";
    std::string background_color = "#000000";
    double background_alpha = 0.0;
    double transform_x = 0.0;
    double transform_y = -0.8;
    int width = 1080;
    int height = 1920;
};

struct EffectClip {
    std::string effect_type;
    double start = 0.0;
    double duration = 3.0;
    std::string track_name = "effect_01";
    nlohmann::json params = nlohmann::json::array();
    int width = 1080;
    int height = 1920;
};

struct StickerClip {
    std::string sticker_url;
    double start = 0.0;
    double duration = 3.0;
    int width = 1080;
    int height = 1920;
    double transform_x = 0.0;
    double transform_y = 0.0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    double rotation = 0.0;
    std::string track_name = "sticker_main";
};

// The external collaborator that turns a validated tool call into a mutation
// of a draft's backing folder. Implementations are synchronous and may throw;
// callers serialize mutations per draft folder.
class Composer {
public:
    virtual ~Composer() = default;

    // Materializes the backing folder and returns its opaque handle.
    virtual std::string create_draft(const std::string& draft_id, int width,
                                     int height) = 0;

    virtual nlohmann::json add_video(const std::string& draft_folder,
                                     const VideoClip& clip) = 0;
    virtual nlohmann::json add_audio(const std::string& draft_folder,
                                     const AudioClip& clip) = 0;
    virtual nlohmann::json add_image(const std::string& draft_folder,
                                     const ImageClip& clip) = 0;
    virtual nlohmann::json add_text(const std::string& draft_folder,
                                    const TextClip& clip) = 0;
    virtual nlohmann::json add_subtitle(const std::string& draft_folder,
                                        const SubtitleImport& subtitle) = 0;
    virtual nlohmann::json add_effect(const std::string& draft_folder,
                                      const EffectClip& clip) = 0;
    virtual nlohmann::json add_sticker(const std::string& draft_folder,
                                       const StickerClip& clip) = 0;

    virtual nlohmann::json save_draft(const std::string& draft_folder,
                                      const std::string& draft_id) = 0;
};

}  // namespace draftline::composer
