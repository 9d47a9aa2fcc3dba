#include "model/Track.hpp"

namespace lyricflow::model {

const char* to_string(TrackState state) {
    switch (state) {
        case TrackState::Pending: return "Pending";
        case TrackState::IdentityResolved: return "IdentityResolved";
        case TrackState::PlanComputed: return "PlanComputed";
        case TrackState::Skipped: return "Skipped";
        case TrackState::Searching: return "Searching";
        case TrackState::Matched: return "Matched";
        case TrackState::Unmatched: return "Unmatched";
        case TrackState::Fetching: return "Fetching";
        case TrackState::Fetched: return "Fetched";
        case TrackState::PartialFetch: return "PartialFetch";
        case TrackState::FetchFailed: return "FetchFailed";
        case TrackState::Writing: return "Writing";
        case TrackState::Done: return "Done";
        case TrackState::WriteFailed: return "WriteFailed";
    }
    return "Unknown";
}

}  // namespace lyricflow::model
