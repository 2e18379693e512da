#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "composer/composer.hpp"
#include "core/errors/draft_errors.hpp"

namespace draftline::composer {

// Composer that keeps each draft as a folder under drafts_root holding one
// draft_content.json manifest: canvas size, tracks with ordered segments,
// and a saved flag.
class DraftFolderComposer : public Composer {
public:
    static constexpr const char* kManifestName = "draft_content.json";

    explicit DraftFolderComposer(std::filesystem::path drafts_root);

    // Creates drafts_root if needed and checks that it is a writable directory.
    // Returns the resolved root.
    core::errors::Result<std::filesystem::path> prepare() const;

    const std::filesystem::path& drafts_root() const { return drafts_root_; }

    std::string create_draft(const std::string& draft_id, int width, int height) override;

    nlohmann::json add_video(const std::string& draft_folder, const VideoClip& clip) override;
    nlohmann::json add_audio(const std::string& draft_folder, const AudioClip& clip) override;
    nlohmann::json add_image(const std::string& draft_folder, const ImageClip& clip) override;
    nlohmann::json add_text(const std::string& draft_folder, const TextClip& clip) override;
    nlohmann::json add_subtitle(const std::string& draft_folder,
                                const SubtitleImport& subtitle) override;
    nlohmann::json add_effect(const std::string& draft_folder, const EffectClip& clip) override;
    nlohmann::json add_sticker(const std::string& draft_folder,
                               const StickerClip& clip) override;

    nlohmann::json save_draft(const std::string& draft_folder,
                              const std::string& draft_id) override;

    // Reads a draft's manifest back. Throws ComposerError when it is missing or corrupt.
    nlohmann::json load_manifest(const std::filesystem::path& draft_folder) const;

private:
    void store_manifest(const std::filesystem::path& draft_folder,
                        const nlohmann::json& manifest) const;

    nlohmann::json append_segment(const std::string& draft_folder, const std::string& track_name,
                                  const std::string& kind, nlohmann::json segment) const;

    std::filesystem::path drafts_root_;
};

}  // namespace draftline::composer
