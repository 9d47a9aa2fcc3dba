#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "core/ExistingStateInspector.hpp"
#include "core/FetchPlanner.hpp"
#include "scanner/PathClassifier.hpp"

using namespace lyricflow;
using lyricflow::core::ExistingStateInspector;
using lyricflow::core::FetchPlanner;
using lyricflow::core::PlanPolicy;

namespace {
    model::TrackCandidate classify(const std::filesystem::path& file, const std::filesystem::path& root) {
        auto candidate = scanner::PathClassifier::classify(file, root);
        if (!candidate) throw test::AssertionFailure("classify failed for " + file.string());
        return *candidate;
    }
}

// --- ExistingStateInspector ---

TEST_CASE(test_inspect_fresh_track) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Jay/Fantasy/01.mp3"), dir.path());

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_TRUE(state == model::ExistingState{});
}

TEST_CASE(test_inspect_finds_sidecars) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Jay/Fantasy/01.mp3"), dir.path());
    dir.touch("Jay/Fantasy/01.lrc", "[00:01.00]La la");
    dir.touch("Jay/Fantasy/cover.jpg", "jpeg");

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_TRUE(state.has_lyrics_sidecar);
    ASSERT_TRUE(state.has_cover_sidecar);
    ASSERT_FALSE(state.has_embedded_lyrics);
}

TEST_CASE(test_inspect_lyrics_sidecar_matches_stem) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Jay/Fantasy/01.mp3"), dir.path());
    dir.touch("Jay/Fantasy/02.lrc", "[00:01.00]Other");

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_FALSE(state.has_lyrics_sidecar);
    ASSERT_EQ(ExistingStateInspector::lyrics_sidecar_path(track).filename().string(), "01.lrc");
}

TEST_CASE(test_inspect_embedded_tags) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Jay/Fantasy/01.flac"), dir.path());
    tags.set(track.absolute_path, {std::nullopt, backend::EmbeddedTagState{true, true, true}});

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_TRUE(state.has_embedded_lyrics);
    ASSERT_TRUE(state.has_embedded_cover);
    ASSERT_TRUE(state.has_embedded_basic_info);
}

TEST_CASE(test_inspect_strm_never_reports_embedded) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Radio/Jay - Fantasy.strm", "http://example.com/1"), dir.path());
    tags.set(track.absolute_path, {std::nullopt, backend::EmbeddedTagState{true, true, true}});

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_FALSE(state.has_embedded_lyrics);
    ASSERT_FALSE(state.has_embedded_cover);
    ASSERT_FALSE(state.has_embedded_basic_info);
}

TEST_CASE(test_inspect_unembeddable_container) {
    test::TempDir dir;
    test::FakeTagStore tags;
    auto track = classify(dir.touch("Jay/Fantasy/01.wav"), dir.path());
    tags.set(track.absolute_path, {std::nullopt, backend::EmbeddedTagState{true, true, true}});

    auto state = ExistingStateInspector(tags).inspect(track);
    ASSERT_FALSE(state.has_embedded_lyrics);
    ASSERT_FALSE(state.has_embedded_cover);
}

// --- FetchPlanner ---

TEST_CASE(test_plan_defaults_fresh_track) {
    auto plan = FetchPlanner::plan(model::ExistingState{}, PlanPolicy{}, true);
    ASSERT_TRUE(plan.lyrics_sidecar);
    ASSERT_TRUE(plan.cover_sidecar);
    ASSERT_FALSE(plan.lyrics_embed);
    ASSERT_FALSE(plan.cover_embed);
    ASSERT_FALSE(plan.basic_info);
    ASSERT_TRUE(plan.need_lyrics());
    ASSERT_TRUE(plan.need_cover());
}

TEST_CASE(test_plan_existing_lyrics_not_refetched) {
    model::ExistingState existing;
    existing.has_lyrics_sidecar = true;

    auto plan = FetchPlanner::plan(existing, PlanPolicy{}, true);
    ASSERT_FALSE(plan.need_lyrics());
    ASSERT_TRUE(plan.need_cover());
}

TEST_CASE(test_plan_overwrite_lyrics) {
    model::ExistingState existing;
    existing.has_lyrics_sidecar = true;
    PlanPolicy policy;
    policy.overwrite_lyrics = true;

    auto plan = FetchPlanner::plan(existing, policy, true);
    ASSERT_TRUE(plan.lyrics_sidecar);
}

TEST_CASE(test_plan_overwrite_without_download_is_nothing) {
    PlanPolicy policy;
    policy.download_lyrics = false;
    policy.download_cover = false;
    policy.overwrite_lyrics = true;
    policy.overwrite_cover = true;

    auto plan = FetchPlanner::plan(model::ExistingState{}, policy, true);
    ASSERT_TRUE(plan.empty());
}

TEST_CASE(test_plan_everything_present_is_empty) {
    model::ExistingState existing{true, true, true, true, true};
    PlanPolicy policy;
    policy.update_lyrics = true;
    policy.update_cover = true;
    policy.update_basic_info = true;

    auto plan = FetchPlanner::plan(existing, policy, true);
    ASSERT_TRUE(plan.empty());
}

TEST_CASE(test_plan_embed_only_when_sidecar_exists) {
    model::ExistingState existing;
    existing.has_lyrics_sidecar = true;
    existing.has_cover_sidecar = true;
    PlanPolicy policy;
    policy.update_lyrics = true;
    policy.update_cover = true;

    auto plan = FetchPlanner::plan(existing, policy, true);
    ASSERT_FALSE(plan.lyrics_sidecar);
    ASSERT_FALSE(plan.cover_sidecar);
    ASSERT_TRUE(plan.lyrics_embed);
    ASSERT_TRUE(plan.cover_embed);
    ASSERT_TRUE(plan.need_lyrics());
}

TEST_CASE(test_plan_no_embedding_without_container) {
    PlanPolicy policy;
    policy.download_lyrics = false;
    policy.download_cover = false;
    policy.update_lyrics = true;
    policy.update_cover = true;
    policy.update_basic_info = true;

    auto plan = FetchPlanner::plan(model::ExistingState{}, policy, false);
    ASSERT_TRUE(plan.empty());
}

TEST_CASE(test_plan_basic_info_ignores_overwrite) {
    model::ExistingState existing;
    existing.has_embedded_basic_info = true;
    PlanPolicy policy;
    policy.download_lyrics = false;
    policy.download_cover = false;
    policy.overwrite_lyrics = true;
    policy.overwrite_cover = true;
    policy.update_basic_info = true;

    auto plan = FetchPlanner::plan(existing, policy, true);
    ASSERT_FALSE(plan.basic_info);
}

TEST_CASE(test_policy_from_config) {
    backend::Config cfg;
    cfg.download_cover = false;
    cfg.update_lyrics = true;
    cfg.overwrite_cover = true;

    auto policy = PlanPolicy::from_config(cfg);
    ASSERT_TRUE(policy.download_lyrics);
    ASSERT_FALSE(policy.download_cover);
    ASSERT_TRUE(policy.update_lyrics);
    ASSERT_TRUE(policy.overwrite_cover);
    ASSERT_FALSE(policy.update_basic_info);
}

int main() {
    return lyricflow::test::TestRunner::instance().run_all();
}
