#include "core/FetchPlanner.hpp"

namespace lyricflow::core {

PlanPolicy PlanPolicy::from_config(const backend::Config& cfg) {
    PlanPolicy policy;
    policy.download_lyrics = cfg.download_lyrics;
    policy.download_cover = cfg.download_cover;
    policy.overwrite_lyrics = cfg.overwrite_lyrics;
    policy.overwrite_cover = cfg.overwrite_cover;
    policy.update_lyrics = cfg.update_lyrics;
    policy.update_cover = cfg.update_cover;
    policy.update_basic_info = cfg.update_basic_info;
    return policy;
}

model::FetchPlan FetchPlanner::plan(const model::ExistingState& existing, const PlanPolicy& policy, bool can_embed) {
    model::FetchPlan plan;

    plan.lyrics_sidecar = policy.download_lyrics && (!existing.has_lyrics_sidecar || policy.overwrite_lyrics);
    plan.cover_sidecar = policy.download_cover && (!existing.has_cover_sidecar || policy.overwrite_cover);

    if (can_embed) {
        plan.lyrics_embed = policy.update_lyrics && (!existing.has_embedded_lyrics || policy.overwrite_lyrics);
        plan.cover_embed = policy.update_cover && (!existing.has_embedded_cover || policy.overwrite_cover);
        plan.basic_info = policy.update_basic_info && !existing.has_embedded_basic_info;
    }

    return plan;
}

}  // namespace lyricflow::core
