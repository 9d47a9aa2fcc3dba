#pragma once

#include "backend/TagStore.hpp"
#include "model/Track.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lyricflow::core {

/**
 * IdentityResolver: canonical artist/album/title for a TrackCandidate.
 *
 * Each field takes the first usable value from, in order:
 *   1. embedded tags (audio files only)
 *   2. folder structure (Artist/Album/file or Artist/file), when enabled
 *   3. filename stem as title; STRM stems of the form "Artist - Title" are split
 *   4. the configured default artist
 *
 * The resulting title is never empty.
 */
class IdentityResolver {
public:
    IdentityResolver(const backend::TagStore& tags, bool use_folder_structure, std::string default_artist);

    [[nodiscard]] model::TrackIdentity resolve(const model::TrackCandidate& candidate) const;

    // Splits on the first " - ". nullopt when there is no separator or either side is empty.
    [[nodiscard]] static std::optional<std::pair<std::string, std::string>> split_artist_title(std::string_view stem);

private:
    const backend::TagStore& tags_;
    bool use_folder_structure_;
    std::string default_artist_;

    static std::string trim(std::string_view s);
};

}  // namespace lyricflow::core
