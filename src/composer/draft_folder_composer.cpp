#include "composer/draft_folder_composer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/config/draft_id.hpp"
#include "core/logging/logger.hpp"

namespace draftline::composer {

using core::errors::DraftError;
using core::errors::ErrorKind;
using nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

template <typename T>
json or_null(const std::optional<T>& value) {
    return value.has_value() ? json(value.value()) : json(nullptr);
}

json span_duration(const double start, const std::optional<double>& end) {
    return end.has_value() ? json(end.value() - start) : json(nullptr);
}

json canvas(const int width, const int height) {
    return json{{"width", width}, {"height", height}};
}

bool is_remote(const std::string& path) {
    return path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0;
}

struct SubtitleCue {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

// Accepts "HH:MM:SS,mmm" (and "." as the millisecond separator).
std::optional<double> parse_srt_time(const std::string& text) {
    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    int millis = 0;
    char sep1 = 0;
    char sep2 = 0;
    char sep3 = 0;
    std::istringstream in(text);
    in >> hours >> sep1 >> minutes >> sep2 >> seconds >> sep3 >> millis;
    if (in.fail() || sep1 != ':' || sep2 != ':' || (sep3 != ',' && sep3 != '.')) {
        return std::nullopt;
    }
    return hours * 3600.0 + minutes * 60.0 + seconds + millis / 1000.0;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<SubtitleCue> read_srt(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ComposerError("Unable to open subtitle file: " + path.string());
    }

    std::vector<SubtitleCue> cues;
    std::optional<SubtitleCue> current;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) {
            if (current.has_value()) {
                cues.push_back(std::move(current.value()));
                current.reset();
            }
            continue;
        }

        const auto arrow = line.find("-->");
        if (arrow != std::string::npos) {
            const auto start = parse_srt_time(trim(line.substr(0, arrow)));
            const auto end = parse_srt_time(trim(line.substr(arrow + 3)));
            if (!start.has_value() || !end.has_value()) {
                throw ComposerError("Malformed subtitle timing line: " + line);
            }
            current = SubtitleCue{start.value(), end.value(), ""};
            continue;
        }

        // Cue numbers precede the timing line and are not kept.
        if (!current.has_value()) {
            continue;
        }
        if (!current->text.empty()) {
            current->text += "\n";
        }
        current->text += line;
    }
    if (current.has_value()) {
        cues.push_back(std::move(current.value()));
    }
    return cues;
}

}  // namespace

DraftFolderComposer::DraftFolderComposer(fs::path drafts_root)
    : drafts_root_(std::move(drafts_root)) {}

core::errors::Result<fs::path> DraftFolderComposer::prepare() const {
    std::error_code ec;
    fs::create_directories(drafts_root_, ec);
    if (ec) {
        return DraftError{ErrorKind::Input,
                          "Unable to create drafts directory: " + drafts_root_.string(),
                          "invalid_drafts_dir", ec.message()};
    }
    if (!fs::is_directory(drafts_root_, ec) || ec) {
        return DraftError{ErrorKind::Input,
                          "Drafts path is not a directory: " + drafts_root_.string(),
                          "invalid_drafts_dir"};
    }

    const auto write_check = drafts_root_ / ".draftline_write_check";
    {
        std::ofstream out(write_check);
        if (!out.is_open()) {
            return DraftError{ErrorKind::Input,
                              "Drafts directory is not writable: " + drafts_root_.string(),
                              "invalid_drafts_dir"};
        }
    }
    fs::remove(write_check, ec);

    const auto resolved = fs::weakly_canonical(drafts_root_, ec);
    if (ec) {
        return DraftError{ErrorKind::Input,
                          "Unable to resolve drafts directory: " + drafts_root_.string(),
                          "invalid_drafts_dir", ec.message()};
    }
    return resolved;
}

json DraftFolderComposer::load_manifest(const fs::path& draft_folder) const {
    const auto manifest_path = draft_folder / kManifestName;
    std::ifstream in(manifest_path);
    if (!in.is_open()) {
        throw ComposerError("Draft manifest not found: " + manifest_path.string());
    }

    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw ComposerError("Draft manifest is corrupt: " + manifest_path.string() + ": " +
                            e.what());
    }
}

void DraftFolderComposer::store_manifest(const fs::path& draft_folder,
                                         const json& manifest) const {
    const auto manifest_path = draft_folder / kManifestName;
    const auto staging_path = draft_folder / (std::string(kManifestName) + ".tmp");

    {
        std::ofstream out(staging_path, std::ios::trunc);
        if (!out.is_open()) {
            throw ComposerError("Unable to open draft manifest: " + staging_path.string());
        }
        out << manifest.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
        if (!out.good()) {
            throw ComposerError("Unable to write draft manifest: " + staging_path.string());
        }
    }

    std::error_code ec;
    fs::rename(staging_path, manifest_path, ec);
    if (ec) {
        throw ComposerError("Unable to replace draft manifest: " + manifest_path.string() +
                            ": " + ec.message());
    }
}

json DraftFolderComposer::append_segment(const std::string& draft_folder,
                                         const std::string& track_name,
                                         const std::string& kind, json segment) const {
    json manifest = load_manifest(draft_folder);
    if (manifest.value("saved", false)) {
        throw ComposerError("Draft is already saved: " + draft_folder);
    }

    json& tracks = manifest["tracks"];
    if (!tracks.is_array()) {
        tracks = json::array();
    }

    json* track = nullptr;
    for (auto& candidate : tracks) {
        if (candidate.value("name", "") == track_name) {
            track = &candidate;
            break;
        }
    }
    if (track == nullptr) {
        tracks.push_back(json{{"name", track_name}, {"kind", kind}, {"segments", json::array()}});
        track = &tracks.back();
    } else if (track->value("kind", "") != kind) {
        throw ComposerError("Track '" + track_name + "' holds " + track->value("kind", "") +
                            " segments, not " + kind);
    }

    const std::string segment_id = core::config::generate_draft_id();
    segment["id"] = segment_id;
    json& segments = (*track)["segments"];
    const std::size_t segment_index = segments.size();
    segments.push_back(std::move(segment));
    manifest["updated_unix_ms"] = now_unix_ms();

    store_manifest(draft_folder, manifest);
    LOG_DEBUG("DraftFolderComposer: " + kind + " segment " + std::to_string(segment_index) +
              " appended to track " + track_name);

    return json{{"track_name", track_name},
                {"segment_index", segment_index},
                {"segment_id", segment_id}};
}

std::string DraftFolderComposer::create_draft(const std::string& draft_id, const int width,
                                              const int height) {
    if (draft_id.empty()) {
        throw ComposerError("Draft id cannot be empty");
    }

    const auto draft_folder = drafts_root_ / draft_id;
    std::error_code ec;
    if (fs::exists(draft_folder / kManifestName, ec)) {
        throw ComposerError("Draft folder already exists: " + draft_folder.string());
    }
    fs::create_directories(draft_folder, ec);
    if (ec) {
        throw ComposerError("Unable to create draft folder: " + draft_folder.string() + ": " +
                            ec.message());
    }

    json manifest;
    manifest["draft_id"] = draft_id;
    manifest["canvas"] = canvas(width, height);
    manifest["tracks"] = json::array();
    manifest["saved"] = false;
    manifest["created_unix_ms"] = now_unix_ms();
    manifest["updated_unix_ms"] = manifest["created_unix_ms"];
    store_manifest(draft_folder, manifest);

    return draft_folder.string();
}

json DraftFolderComposer::add_video(const std::string& draft_folder, const VideoClip& clip) {
    json segment;
    segment["source"] = clip.video_url;
    segment["source_start"] = clip.start;
    segment["source_end"] = or_null(clip.end);
    segment["duration"] = span_duration(clip.start, clip.end);
    segment["target_start"] = clip.target_start;
    segment["canvas"] = canvas(clip.width, clip.height);
    segment["transform"] = {{"x", clip.transform_x}, {"y", clip.transform_y}};
    segment["scale"] = {{"x", clip.scale_x}, {"y", clip.scale_y}};
    segment["speed"] = clip.speed;
    segment["volume"] = clip.volume;
    segment["transition"] = or_null(clip.transition);
    segment["transition_duration"] = clip.transition_duration;
    segment["mask_type"] = or_null(clip.mask_type);
    segment["background_blur"] = or_null(clip.background_blur);
    return append_segment(draft_folder, clip.track_name, "video", std::move(segment));
}

json DraftFolderComposer::add_audio(const std::string& draft_folder, const AudioClip& clip) {
    json segment;
    segment["source"] = clip.audio_url;
    segment["source_start"] = clip.start;
    segment["source_end"] = or_null(clip.end);
    segment["duration"] = span_duration(clip.start, clip.end);
    segment["target_start"] = clip.target_start;
    segment["volume"] = clip.volume;
    segment["speed"] = clip.speed;
    segment["canvas"] = canvas(clip.width, clip.height);
    return append_segment(draft_folder, clip.track_name, "audio", std::move(segment));
}

json DraftFolderComposer::add_image(const std::string& draft_folder, const ImageClip& clip) {
    json segment;
    segment["source"] = clip.image_url;
    segment["start"] = clip.start;
    segment["duration"] = clip.duration;
    segment["canvas"] = canvas(clip.width, clip.height);
    segment["transform"] = {{"x", clip.transform_x}, {"y", clip.transform_y}};
    segment["scale"] = {{"x", clip.scale_x}, {"y", clip.scale_y}};
    segment["intro_animation"] = or_null(clip.intro_animation);
    segment["outro_animation"] = or_null(clip.outro_animation);
    segment["transition"] = or_null(clip.transition);
    segment["mask_type"] = or_null(clip.mask_type);
    return append_segment(draft_folder, clip.track_name, "image", std::move(segment));
}

json DraftFolderComposer::add_text(const std::string& draft_folder, const TextClip& clip) {
    json segment;
    segment["text"] = clip.text;
    segment["start"] = clip.start;
    segment["duration"] = clip.duration;
    segment["canvas"] = canvas(clip.width, clip.height);
    segment["font"] = {{"color", clip.font_color}, {"size", clip.font_size}};
    segment["text_styles"] = clip.text_styles;
    if (clip.shadow_enabled) {
        segment["shadow"] = {{"color", clip.shadow_color},
                             {"alpha", clip.shadow_alpha},
                             {"angle", clip.shadow_angle},
                             {"distance", clip.shadow_distance},
                             {"smoothing", clip.shadow_smoothing}};
    } else {
        segment["shadow"] = nullptr;
    }
    if (clip.background_color.has_value()) {
        segment["background"] = {{"color", clip.background_color.value()},
                                 {"alpha", clip.background_alpha},
                                 {"style", clip.background_style},
                                 {"round_radius", clip.background_round_radius}};
    } else {
        segment["background"] = nullptr;
    }
    return append_segment(draft_folder, clip.track_name, "text", std::move(segment));
}

json DraftFolderComposer::add_subtitle(const std::string& draft_folder,
                                       const SubtitleImport& subtitle) {
    json segment;
    segment["source"] = subtitle.srt_path;
    segment["time_offset"] = subtitle.time_offset;
    segment["canvas"] = canvas(subtitle.width, subtitle.height);
    segment["style"] = {{"font", or_null(subtitle.font)},
                        {"font_size", subtitle.font_size},
                        {"font_color", subtitle.font_color},
                        {"bold", subtitle.bold},
                        {"italic", subtitle.italic},
                        {"underline", subtitle.underline},
                        {"border_width", subtitle.border_width},
                        {"border_color", subtitle.border_color},
                        {"background_color", subtitle.background_color},
                        {"background_alpha", subtitle.background_alpha}};
    segment["transform"] = {{"x", subtitle.transform_x}, {"y", subtitle.transform_y}};

    // Remote sources are recorded as-is; local files are expanded into cues.
    json cues = json::array();
    if (!is_remote(subtitle.srt_path)) {
        for (const auto& cue : read_srt(subtitle.srt_path)) {
            cues.push_back(json{{"start", cue.start + subtitle.time_offset},
                                {"duration", cue.end - cue.start},
                                {"text", cue.text}});
        }
    }
    const std::size_t cue_count = cues.size();
    segment["cues"] = std::move(cues);

    json placed =
        append_segment(draft_folder, subtitle.track_name, "subtitle", std::move(segment));
    placed["cue_count"] = cue_count;
    return placed;
}

json DraftFolderComposer::add_effect(const std::string& draft_folder, const EffectClip& clip) {
    json segment;
    segment["effect_type"] = clip.effect_type;
    segment["start"] = clip.start;
    segment["duration"] = clip.duration;
    segment["params"] = clip.params;
    segment["canvas"] = canvas(clip.width, clip.height);
    return append_segment(draft_folder, clip.track_name, "effect", std::move(segment));
}

json DraftFolderComposer::add_sticker(const std::string& draft_folder,
                                      const StickerClip& clip) {
    json segment;
    segment["source"] = clip.sticker_url;
    segment["start"] = clip.start;
    segment["duration"] = clip.duration;
    segment["canvas"] = canvas(clip.width, clip.height);
    segment["transform"] = {{"x", clip.transform_x}, {"y", clip.transform_y}};
    segment["scale"] = {{"x", clip.scale_x}, {"y", clip.scale_y}};
    segment["rotation"] = clip.rotation;
    return append_segment(draft_folder, clip.track_name, "sticker", std::move(segment));
}

json DraftFolderComposer::save_draft(const std::string& draft_folder,
                                     const std::string& draft_id) {
    json manifest = load_manifest(draft_folder);
    if (manifest.value("draft_id", "") != draft_id) {
        throw ComposerError("Draft folder " + draft_folder + " does not belong to draft " +
                            draft_id);
    }

    std::size_t track_count = 0;
    std::size_t segment_count = 0;
    if (manifest["tracks"].is_array()) {
        track_count = manifest["tracks"].size();
        for (const auto& track : manifest["tracks"]) {
            segment_count += track.value("segments", json::array()).size();
        }
    }

    manifest["saved"] = true;
    manifest["saved_unix_ms"] = now_unix_ms();
    manifest["track_count"] = track_count;
    manifest["segment_count"] = segment_count;
    store_manifest(draft_folder, manifest);
    LOG_INFO("DraftFolderComposer: draft " + draft_id + " saved with " +
             std::to_string(track_count) + " tracks and " + std::to_string(segment_count) +
             " segments");

    return json{{"draft_folder", draft_folder},
                {"draft_content", (fs::path(draft_folder) / kManifestName).string()},
                {"track_count", track_count},
                {"segment_count", segment_count}};
}

}  // namespace draftline::composer
