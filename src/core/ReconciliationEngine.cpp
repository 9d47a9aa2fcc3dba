#include "core/ReconciliationEngine.hpp"
#include "core/SidecarWriter.hpp"
#include "net/HttpClient.hpp"
#include "scanner/LibraryWalker.hpp"
#include "scanner/PathClassifier.hpp"
#include "util/Logger.hpp"
#include "util/WorkerPool.hpp"
#include <format>
#include <thread>

namespace lyricflow::core {

namespace fs = std::filesystem;
using model::TrackState;

EngineOptions EngineOptions::from_config(const backend::Config& cfg) {
    EngineOptions options;
    options.policy = PlanPolicy::from_config(cfg);
    options.use_folder_structure = cfg.use_folder_structure;
    options.default_artist = cfg.default_artist;
    options.workers = static_cast<size_t>(cfg.workers);
    options.request_delay = std::chrono::milliseconds(cfg.request_delay_ms);
    return options;
}

ReconciliationEngine::ReconciliationEngine(EngineOptions options,
                                           provider::ProviderGateway& provider,
                                           backend::TagStore& tags)
    : options_(std::move(options)),
      provider_(provider),
      tags_(tags),
      resolver_(tags, options_.use_folder_structure, options_.default_artist),
      inspector_(tags) {}

std::string ReconciliationEngine::display_name(const model::TrackCandidate& candidate) {
    return fs::path(candidate.absolute_path).filename().string();
}

model::RunSummary ReconciliationEngine::run(const std::vector<fs::path>& roots, std::stop_token stop) {
    model::RunSummary summary;
    std::mutex summary_mutex;
    cover_cache_.clear();

    {
        util::WorkerPool pool(options_.workers);

        for (const auto& root : roots) {
            if (stop.stop_requested()) break;

            auto walk = scanner::LibraryWalker::walk(root);
            for (const auto& path : walk.media_files) {
                if (stop.stop_requested()) break;

                auto candidate = scanner::PathClassifier::classify(path, root);
                if (!candidate) continue;

                pool.submit([this, candidate = std::move(*candidate), stop, &summary, &summary_mutex]() {
                    // Cancellation takes effect between tracks, never inside one
                    if (stop.stop_requested()) return;

                    auto outcome = process_track(candidate);
                    {
                        std::lock_guard<std::mutex> lock(summary_mutex);
                        record(summary, outcome);
                    }

                    if (outcome.contacted_provider && options_.request_delay.count() > 0) {
                        std::this_thread::sleep_for(options_.request_delay);
                    }
                });
            }
        }

        pool.wait_idle();
    }

    cover_cache_.clear();
    summary.cancelled = stop.stop_requested();
    if (summary.cancelled) {
        util::Logger::warn("Engine: Pass cancelled");
    }
    return summary;
}

model::TrackOutcome ReconciliationEngine::process_track(const model::TrackCandidate& candidate) {
    model::TrackOutcome outcome;
    outcome.path = candidate.absolute_path;

    try {
        auto identity = resolver_.resolve(candidate);
        outcome.state = TrackState::IdentityResolved;
        util::Logger::debug("Engine: " + display_name(candidate) + " -> artist='" + identity.artist +
                            "' album='" + identity.album + "' title='" + identity.title + "'");

        auto existing = inspector_.inspect(candidate);
        bool can_embed = false;
        switch (candidate.kind) {
            case model::TrackKind::AudioFile:
                can_embed = tags_.supports_embedding(candidate.absolute_path);
                break;
            case model::TrackKind::StrmFile:
                break;
        }

        auto plan = FetchPlanner::plan(existing, options_.policy, can_embed);
        outcome.state = TrackState::PlanComputed;

        if (plan.empty()) {
            outcome.state = TrackState::Skipped;
            util::Logger::debug("Engine: Up to date: " + display_name(candidate));
            return outcome;
        }

        fetch_and_write(candidate, identity, plan, outcome);
        util::Logger::debug("Engine: " + display_name(candidate) + " finished as " +
                            model::to_string(outcome.state));
    } catch (const std::exception& e) {
        outcome.state = TrackState::WriteFailed;
        outcome.error_message = e.what();
        util::Logger::error("Engine: Failed " + candidate.absolute_path + ": " + e.what());
    }
    return outcome;
}

void ReconciliationEngine::fetch_and_write(const model::TrackCandidate& candidate,
                                           const model::TrackIdentity& identity,
                                           const model::FetchPlan& plan,
                                           model::TrackOutcome& outcome) {
    const std::string name = display_name(candidate);
    const std::string album_dir = ExistingStateInspector::album_directory(candidate).string();

    // A sibling may already have settled this directory's cover
    std::optional<model::Bytes> settled_cover;
    if (plan.need_cover()) {
        settled_cover = cover_cache_.peek(album_dir);
    }

    std::optional<model::MatchInfo> match;
    const bool need_search = plan.need_lyrics() || plan.basic_info || (plan.need_cover() && !settled_cover);
    if (need_search) {
        outcome.state = TrackState::Searching;
        outcome.contacted_provider = true;
        try {
            match = provider_.search_track(identity);
        } catch (const net::ProviderError& e) {
            outcome.state = TrackState::Unmatched;
            outcome.provider_error = true;
            outcome.error_message = e.what();
            util::Logger::warn("Engine: Search failed for " + identity.artist + " - " + identity.title + ": " + e.what());
            return;
        }
        if (!match) {
            outcome.state = TrackState::Unmatched;
            util::Logger::info("No match: " + identity.artist + " - " + identity.title);
            return;
        }
        outcome.state = TrackState::Matched;
        util::Logger::debug(std::format("Engine: Matched {} on {} as {} - {}",
                                        name, match->platform, match->artist, match->title));
    }

    outcome.state = TrackState::Fetching;
    model::FetchResult result;
    int wanted = 0;
    int obtained = 0;

    if (plan.need_lyrics()) {
        ++wanted;
        try {
            result.lyrics_text = provider_.fetch_lyrics(*match);
        } catch (const net::ProviderError& e) {
            outcome.provider_error = true;
            outcome.error_message = e.what();
            util::Logger::warn("Engine: Lyrics fetch failed for " + name + ": " + e.what());
        }
        if (result.lyrics_text) ++obtained;
    }

    bool cover_owner = false;
    if (plan.need_cover()) {
        ++wanted;
        if (settled_cover) {
            result.cover_bytes = *settled_cover;
        } else {
            try {
                auto lookup = cover_cache_.get_or_fetch(album_dir, [this, &match, &outcome]() {
                    outcome.contacted_provider = true;
                    return provider_.fetch_cover(*match);
                });
                result.cover_bytes = std::move(lookup.cover);
                cover_owner = lookup.fetched_here;
            } catch (const net::ProviderError& e) {
                cover_owner = true;
                outcome.provider_error = true;
                outcome.error_message = e.what();
                util::Logger::warn("Engine: Cover fetch failed for " + name + ": " + e.what());
            }
        }
        if (result.cover_bytes) ++obtained;
    }

    if (match) {
        if (!match->title.empty()) result.matched_title = match->title;
        if (!match->artist.empty()) result.matched_artist = match->artist;
        if (!match->album.empty()) result.matched_album = match->album;
    }
    if (plan.basic_info) {
        ++wanted;
        if (result.matched_title || result.matched_artist || result.matched_album) ++obtained;
    }

    if (obtained == wanted) {
        outcome.fetch_state = TrackState::Fetched;
    } else if (obtained > 0) {
        outcome.fetch_state = TrackState::PartialFetch;
    } else {
        outcome.fetch_state = TrackState::FetchFailed;
    }

    // Sidecars first. A failed lyrics sidecar does not hold back the cover.
    outcome.state = TrackState::Writing;
    std::optional<std::string> sidecar_error;

    if (plan.lyrics_sidecar && result.lyrics_text) {
        auto path = ExistingStateInspector::lyrics_sidecar_path(candidate);
        auto written = SidecarWriter::write_text(path, *result.lyrics_text);
        if (written == WriteResult::Failed) {
            sidecar_error = "Cannot write " + path.string();
        } else if (written == WriteResult::Written) {
            outcome.lyrics_written = true;
            util::Logger::info("Saved lyrics: " + path.filename().string());
        }
    }

    // Only the sibling that fetched the cover writes the shared cover.jpg
    if (plan.cover_sidecar && result.cover_bytes && cover_owner) {
        auto path = ExistingStateInspector::cover_sidecar_path(candidate);
        auto written = SidecarWriter::write_bytes(path, result.cover_bytes->data(), result.cover_bytes->size());
        if (written == WriteResult::Failed) {
            if (!sidecar_error) sidecar_error = "Cannot write " + path.string();
        } else if (written == WriteResult::Written) {
            outcome.cover_written = true;
            util::Logger::info("Saved cover: " + path.string());
        }
    }

    if (sidecar_error) {
        outcome.state = TrackState::WriteFailed;
        outcome.error_message = *sidecar_error;
        util::Logger::error("Engine: " + outcome.error_message);
        return;
    }

    // Then embedded tags, in a single save
    backend::TagUpdate update;
    if (plan.lyrics_embed && result.lyrics_text) {
        update.lyrics = result.lyrics_text;
    }
    if (plan.cover_embed && result.cover_bytes) {
        update.cover = result.cover_bytes;
    }
    if (plan.basic_info) {
        update.title = result.matched_title;
        update.artist = result.matched_artist;
        update.album = result.matched_album;
    }

    if (!update.empty()) {
        if (!tags_.write_tags(candidate.absolute_path, update)) {
            outcome.state = TrackState::WriteFailed;
            outcome.error_message = "Cannot update tags of " + candidate.absolute_path;
            util::Logger::error("Engine: " + outcome.error_message);
            return;
        }
        outcome.tags_updated = true;
        if (update.lyrics) util::Logger::info("Embedded lyrics: " + name);
        if (update.cover) util::Logger::info("Embedded cover: " + name);
        if (update.title || update.artist || update.album) util::Logger::info("Updated info: " + name);
    }

    outcome.state = TrackState::Done;
}

void ReconciliationEngine::record(model::RunSummary& summary, const model::TrackOutcome& outcome) {
    ++summary.processed;

    switch (outcome.state) {
        case TrackState::Skipped:
            ++summary.skipped;
            break;
        case TrackState::Unmatched:
            if (outcome.provider_error) {
                ++summary.failed;
            } else {
                ++summary.unmatched;
            }
            break;
        case TrackState::Done:
            if (outcome.provider_error) ++summary.failed;
            break;
        case TrackState::WriteFailed:
            ++summary.failed;
            break;
        default:
            break;
    }

    if (outcome.fetch_state != TrackState::Pending) ++summary.matched;
    if (outcome.lyrics_written) ++summary.lyrics_written;
    if (outcome.cover_written) ++summary.covers_written;
    if (outcome.tags_updated) ++summary.tags_updated;
}

void ReconciliationEngine::log_summary(const model::RunSummary& summary) {
    util::Logger::info("==================================================");
    util::Logger::info(summary.cancelled ? "Pass cancelled" : "Pass complete");
    util::Logger::info(std::format("  Processed:  {} files", summary.processed));
    util::Logger::info(std::format("  Skipped:    {} (up to date)", summary.skipped));
    util::Logger::info(std::format("  Matched:    {}", summary.matched));
    util::Logger::info(std::format("  Unmatched:  {}", summary.unmatched));
    util::Logger::info(std::format("  Failed:     {}", summary.failed));
    util::Logger::info(std::format("  Lyrics:     {} written", summary.lyrics_written));
    util::Logger::info(std::format("  Covers:     {} written", summary.covers_written));
    util::Logger::info(std::format("  Tags:       {} updated", summary.tags_updated));
    util::Logger::info("==================================================");
}

}  // namespace lyricflow::core
