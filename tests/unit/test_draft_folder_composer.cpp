#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "composer/draft_folder_composer.hpp"
#include "core/config/draft_id.hpp"
#include "core/errors/draft_errors.hpp"

namespace {

using draftline::composer::AudioClip;
using draftline::composer::ComposerError;
using draftline::composer::DraftFolderComposer;
using draftline::composer::EffectClip;
using draftline::composer::SubtitleImport;
using draftline::composer::TextClip;
using draftline::composer::VideoClip;
using draftline::core::errors::get_error;
using draftline::core::errors::get_value;
using draftline::core::errors::is_error;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_draft_folder_composer_" + draftline::core::config::generate_draft_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

TEST(DraftFolderComposerTest, PrepareCreatesMissingRoot) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root() / "nested" / "drafts");

    auto prepared = composer.prepare();
    ASSERT_FALSE(is_error(prepared));
    EXPECT_TRUE(std::filesystem::is_directory(get_value(prepared)));
}

TEST(DraftFolderComposerTest, PrepareRejectsFileAsRoot) {
    TempWorkspace workspace;
    const auto file_path = workspace.root() / "not_a_dir";
    {
        std::ofstream out(file_path);
        out << "x";
    }

    DraftFolderComposer composer(file_path);
    auto prepared = composer.prepare();
    ASSERT_TRUE(is_error(prepared));
    EXPECT_EQ(get_error(prepared).code, "invalid_drafts_dir");
}

TEST(DraftFolderComposerTest, CreateDraftWritesManifest) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());

    const std::string folder = composer.create_draft("draft-1", 720, 1280);
    EXPECT_EQ(folder, (workspace.root() / "draft-1").string());
    ASSERT_TRUE(std::filesystem::exists(std::filesystem::path(folder) / "draft_content.json"));

    const json manifest = composer.load_manifest(folder);
    EXPECT_EQ(manifest["draft_id"], "draft-1");
    EXPECT_EQ(manifest["canvas"]["width"], 720);
    EXPECT_EQ(manifest["canvas"]["height"], 1280);
    EXPECT_EQ(manifest["saved"], false);
    EXPECT_TRUE(manifest["tracks"].empty());
}

TEST(DraftFolderComposerTest, CreateDraftRefusesExistingDraft) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    composer.create_draft("draft-1", 1080, 1920);
    EXPECT_THROW(composer.create_draft("draft-1", 1080, 1920), ComposerError);
}

TEST(DraftFolderComposerTest, SegmentsAppendPerTrack) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);

    VideoClip first;
    first.video_url = "https://example.com/a.mp4";
    first.start = 1.0;
    first.end = 5.0;
    VideoClip second;
    second.video_url = "https://example.com/b.mp4";

    const json placed_first = composer.add_video(folder, first);
    const json placed_second = composer.add_video(folder, second);
    EXPECT_EQ(placed_first["track_name"], "main");
    EXPECT_EQ(placed_first["segment_index"], 0);
    EXPECT_EQ(placed_second["segment_index"], 1);
    EXPECT_NE(placed_first["segment_id"], placed_second["segment_id"]);

    AudioClip audio;
    audio.audio_url = "https://example.com/a.mp3";
    EXPECT_EQ(composer.add_audio(folder, audio)["segment_index"], 0);

    const json manifest = composer.load_manifest(folder);
    ASSERT_EQ(manifest["tracks"].size(), 2u);
    const json& video_track = manifest["tracks"][0];
    EXPECT_EQ(video_track["kind"], "video");
    ASSERT_EQ(video_track["segments"].size(), 2u);
    EXPECT_DOUBLE_EQ(video_track["segments"][0]["duration"].get<double>(), 4.0);
    EXPECT_TRUE(video_track["segments"][1]["duration"].is_null());
    EXPECT_EQ(manifest["tracks"][1]["kind"], "audio");
}

TEST(DraftFolderComposerTest, TrackKindMismatchThrows) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);

    EffectClip effect;
    effect.effect_type = "glow";
    effect.track_name = "shared";
    composer.add_effect(folder, effect);

    TextClip text;
    text.text = "hello";
    text.track_name = "shared";
    EXPECT_THROW(composer.add_text(folder, text), ComposerError);
}

TEST(DraftFolderComposerTest, SubtitleFileIsExpandedIntoCues) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root() / "drafts");
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);

    const auto srt_path = workspace.root() / "captions.srt";
    {
        std::ofstream out(srt_path);
        out << "1\n00:00:01,000 --> 00:00:02,500\nHello\n\n"
            << "2\n00:00:03,000 --> 00:00:04,000\nTwo\nlines\n";
    }

    SubtitleImport subtitle;
    subtitle.srt_path = srt_path.string();
    subtitle.time_offset = 10.0;
    const json placed = composer.add_subtitle(folder, subtitle);
    EXPECT_EQ(placed["track_name"], "subtitle");
    EXPECT_EQ(placed["cue_count"], 2);

    const json cues = composer.load_manifest(folder)["tracks"][0]["segments"][0]["cues"];
    ASSERT_EQ(cues.size(), 2u);
    EXPECT_DOUBLE_EQ(cues[0]["start"].get<double>(), 11.0);
    EXPECT_DOUBLE_EQ(cues[0]["duration"].get<double>(), 1.5);
    EXPECT_EQ(cues[1]["text"], "Two\nlines");
}

TEST(DraftFolderComposerTest, MissingSubtitleFileThrows) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);

    SubtitleImport subtitle;
    subtitle.srt_path = (workspace.root() / "missing.srt").string();
    EXPECT_THROW(composer.add_subtitle(folder, subtitle), ComposerError);
}

TEST(DraftFolderComposerTest, SaveDraftReportsCountsAndLocksManifest) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);

    TextClip text;
    text.text = "title";
    text.duration = 2.0;
    composer.add_text(folder, text);
    composer.add_text(folder, text);
    EffectClip effect;
    effect.effect_type = "blur";
    composer.add_effect(folder, effect);

    const json saved = composer.save_draft(folder, "draft-1");
    EXPECT_EQ(saved["draft_folder"], folder);
    EXPECT_EQ(saved["track_count"], 2);
    EXPECT_EQ(saved["segment_count"], 3);
    EXPECT_EQ(std::filesystem::path(saved["draft_content"].get<std::string>()).filename().string(),
              "draft_content.json");

    EXPECT_EQ(composer.load_manifest(folder)["saved"], true);
    EXPECT_THROW(composer.add_effect(folder, effect), ComposerError);
}

TEST(DraftFolderComposerTest, SaveDraftChecksOwnership) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    const std::string folder = composer.create_draft("draft-1", 1080, 1920);
    EXPECT_THROW(composer.save_draft(folder, "draft-2"), ComposerError);
}

TEST(DraftFolderComposerTest, MissingManifestThrows) {
    TempWorkspace workspace;
    DraftFolderComposer composer(workspace.root());
    EXPECT_THROW(composer.load_manifest(workspace.root() / "ghost"), ComposerError);
}

}  // namespace
