#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lyricflow::model {

enum class TrackKind {
    AudioFile,
    StrmFile,
};

// Raw image bytes as stored in cover.jpg or an embedded picture frame
using Bytes = std::vector<uint8_t>;

// One classified filesystem entry. Built once by PathClassifier, never mutated.
struct TrackCandidate {
    std::string absolute_path;
    TrackKind kind = TrackKind::AudioFile;
    std::vector<std::string> folder_chain;  // Directories below the library root, outermost first
    std::string raw_filename_stem;
    std::string extension;                  // Lowercase, with leading dot
};

struct TrackIdentity {
    std::string artist;
    std::string album;
    std::string title;  // Never empty after resolution

    bool operator==(const TrackIdentity&) const = default;
};

struct ExistingState {
    bool has_lyrics_sidecar = false;
    bool has_cover_sidecar = false;
    bool has_embedded_lyrics = false;
    bool has_embedded_cover = false;
    bool has_embedded_basic_info = false;

    bool operator==(const ExistingState&) const = default;
};

struct FetchPlan {
    bool lyrics_sidecar = false;
    bool lyrics_embed = false;
    bool cover_sidecar = false;
    bool cover_embed = false;
    bool basic_info = false;

    bool need_lyrics() const { return lyrics_sidecar || lyrics_embed; }
    bool need_cover() const { return cover_sidecar || cover_embed; }
    bool empty() const { return !need_lyrics() && !need_cover() && !basic_info; }
};

// Provider match. id is opaque to everything but the provider that produced it.
struct MatchInfo {
    std::string id;
    std::string title;
    std::string artist;
    std::string album;
    std::string platform;
    std::string lyrics_url;
    std::string cover_url;
};

// Absent fields mean the provider had nothing, which is not an error.
struct FetchResult {
    std::optional<std::string> lyrics_text;
    std::optional<Bytes> cover_bytes;
    std::optional<std::string> matched_title;
    std::optional<std::string> matched_artist;
    std::optional<std::string> matched_album;
};

enum class TrackState {
    Pending,
    IdentityResolved,
    PlanComputed,
    Skipped,
    Searching,
    Matched,
    Unmatched,
    Fetching,
    Fetched,
    PartialFetch,
    FetchFailed,
    Writing,
    Done,
    WriteFailed,
};

const char* to_string(TrackState state);

inline bool is_terminal(TrackState state) {
    return state == TrackState::Done || state == TrackState::Skipped ||
           state == TrackState::Unmatched || state == TrackState::WriteFailed;
}

struct TrackOutcome {
    std::string path;
    TrackState state = TrackState::Pending;
    TrackState fetch_state = TrackState::Pending;  // Fetched, PartialFetch or FetchFailed when fetching ran
    bool provider_error = false;
    bool contacted_provider = false;               // At least one search or fetch went out
    bool lyrics_written = false;
    bool cover_written = false;
    bool tags_updated = false;
    std::string error_message;
};

struct RunSummary {
    size_t processed = 0;
    size_t skipped = 0;
    size_t matched = 0;
    size_t unmatched = 0;
    size_t failed = 0;
    size_t lyrics_written = 0;
    size_t covers_written = 0;
    size_t tags_updated = 0;
    bool cancelled = false;
};

}  // namespace lyricflow::model
