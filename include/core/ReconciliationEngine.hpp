#pragma once

#include "backend/Config.hpp"
#include "backend/TagStore.hpp"
#include "core/AlbumCoverCache.hpp"
#include "core/ExistingStateInspector.hpp"
#include "core/FetchPlanner.hpp"
#include "core/IdentityResolver.hpp"
#include "model/Track.hpp"
#include "provider/ProviderGateway.hpp"
#include <chrono>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace lyricflow::core {

struct EngineOptions {
    PlanPolicy policy;
    bool use_folder_structure = true;
    std::string default_artist;
    size_t workers = 4;
    std::chrono::milliseconds request_delay{200};

    static EngineOptions from_config(const backend::Config& cfg);
};

/**
 * ReconciliationEngine: one pass over the library.
 *
 * Per track: resolve identity, inspect existing state, plan, and only when
 * the plan asks for something contact the provider. Lyrics and cover are
 * fetched independently. Sidecars are written first; embedded tags are
 * updated only after every requested sidecar write succeeded.
 *
 * Tracks run on a bounded WorkerPool. The only state shared between tracks
 * is the AlbumCoverCache, which lives for one run(). A track's failure is
 * reported in its TrackOutcome and never stops the pass.
 */
class ReconciliationEngine {
public:
    ReconciliationEngine(EngineOptions options, provider::ProviderGateway& provider, backend::TagStore& tags);

    // Walks every root and processes each track. Stops handing out tracks
    // once stop is requested; tracks already running finish their writes.
    model::RunSummary run(const std::vector<std::filesystem::path>& roots, std::stop_token stop = {});

    // Full per-track state machine. Never throws.
    model::TrackOutcome process_track(const model::TrackCandidate& candidate);

    // Folds one outcome into the pass totals
    static void record(model::RunSummary& summary, const model::TrackOutcome& outcome);

    static void log_summary(const model::RunSummary& summary);

private:
    EngineOptions options_;
    provider::ProviderGateway& provider_;
    backend::TagStore& tags_;
    IdentityResolver resolver_;
    ExistingStateInspector inspector_;
    AlbumCoverCache cover_cache_;

    void fetch_and_write(const model::TrackCandidate& candidate,
                         const model::TrackIdentity& identity,
                         const model::FetchPlan& plan,
                         model::TrackOutcome& outcome);

    static std::string display_name(const model::TrackCandidate& candidate);
};

}  // namespace lyricflow::core
