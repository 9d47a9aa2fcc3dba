#include "core/ExistingStateInspector.hpp"
#include "util/Logger.hpp"
#include <system_error>

namespace lyricflow::core {

namespace fs = std::filesystem;

ExistingStateInspector::ExistingStateInspector(const backend::TagStore& tags) : tags_(tags) {}

fs::path ExistingStateInspector::album_directory(const model::TrackCandidate& candidate) {
    return fs::path(candidate.absolute_path).parent_path();
}

fs::path ExistingStateInspector::lyrics_sidecar_path(const model::TrackCandidate& candidate) {
    return album_directory(candidate) / (candidate.raw_filename_stem + LYRICS_EXTENSION);
}

fs::path ExistingStateInspector::cover_sidecar_path(const model::TrackCandidate& candidate) {
    return album_directory(candidate) / COVER_FILENAME;
}

bool ExistingStateInspector::regular_file_exists(const fs::path& path) {
    std::error_code ec;
    bool exists = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        util::Logger::warn("Inspector: Cannot stat " + path.string() + ": " + ec.message());
    }
    return exists && !ec;
}

model::ExistingState ExistingStateInspector::inspect(const model::TrackCandidate& candidate) const {
    model::ExistingState state;
    state.has_lyrics_sidecar = regular_file_exists(lyrics_sidecar_path(candidate));
    state.has_cover_sidecar = regular_file_exists(cover_sidecar_path(candidate));

    switch (candidate.kind) {
        case model::TrackKind::AudioFile:
            if (tags_.supports_embedding(candidate.absolute_path)) {
                auto embedded = tags_.probe(candidate.absolute_path);
                state.has_embedded_lyrics = embedded.lyrics;
                state.has_embedded_cover = embedded.cover;
                state.has_embedded_basic_info = embedded.basic_info;
            }
            break;
        case model::TrackKind::StrmFile:
            // Plain-text pointers carry no tags
            break;
    }
    return state;
}

}  // namespace lyricflow::core
