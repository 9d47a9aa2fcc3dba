#pragma once

#include "backend/Config.hpp"
#include "model/Track.hpp"

namespace lyricflow::core {

// The download/overwrite/update toggles that decide a FetchPlan
struct PlanPolicy {
    bool download_lyrics = true;
    bool download_cover = true;
    bool overwrite_lyrics = false;
    bool overwrite_cover = false;
    bool update_lyrics = false;
    bool update_cover = false;
    bool update_basic_info = false;

    static PlanPolicy from_config(const backend::Config& cfg);
};

class FetchPlanner {
public:
    // can_embed: the track is an audio file in a container tags can be written to.
    // Without it the plan has no embedding consumers.
    [[nodiscard]] static model::FetchPlan plan(const model::ExistingState& existing,
                                               const PlanPolicy& policy,
                                               bool can_embed);
};

}  // namespace lyricflow::core
