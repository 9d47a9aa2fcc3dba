#pragma once

#include "backend/TagStore.hpp"
#include "model/Track.hpp"
#include <filesystem>

namespace lyricflow::core {

// Read-only probe of what a track already has on disk and in its tags.
// Derived fresh on every pass; nothing is remembered between runs.
class ExistingStateInspector {
public:
    static constexpr const char* COVER_FILENAME = "cover.jpg";
    static constexpr const char* LYRICS_EXTENSION = ".lrc";

    explicit ExistingStateInspector(const backend::TagStore& tags);

    [[nodiscard]] model::ExistingState inspect(const model::TrackCandidate& candidate) const;

    // <dir>/<stem>.lrc
    [[nodiscard]] static std::filesystem::path lyrics_sidecar_path(const model::TrackCandidate& candidate);

    // <dir>/cover.jpg, shared by every track in the directory
    [[nodiscard]] static std::filesystem::path cover_sidecar_path(const model::TrackCandidate& candidate);

    [[nodiscard]] static std::filesystem::path album_directory(const model::TrackCandidate& candidate);

private:
    const backend::TagStore& tags_;

    static bool regular_file_exists(const std::filesystem::path& path);
};

}  // namespace lyricflow::core
