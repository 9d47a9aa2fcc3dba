#pragma once

#include "model/Track.hpp"
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lyricflow::scanner {

/**
 * PathClassifier: turns one filesystem entry into a TrackCandidate.
 *
 * Directories, hidden entries, unknown extensions and the sidecars this tool
 * writes itself (cover.jpg, *.lrc) are skipped. Unreadable entries are logged
 * and skipped; classification never throws.
 */
class PathClassifier {
public:
    [[nodiscard]] static std::optional<model::TrackCandidate> classify(
        const std::filesystem::path& entry,
        const std::filesystem::path& library_root
    );

    // Filename-only checks, usable before any stat()
    [[nodiscard]] static std::optional<model::TrackKind> kind_for_filename(std::string_view filename);
    [[nodiscard]] static bool is_excluded_filename(std::string_view filename);

    // Directories strictly between library_root and entry, outermost first
    [[nodiscard]] static std::vector<std::string> folder_chain(
        const std::filesystem::path& entry,
        const std::filesystem::path& library_root
    );

private:
    static constexpr std::array<std::string_view, 7> AUDIO_EXTENSIONS = {
        ".mp3", ".flac", ".m4a", ".wav", ".ogg", ".wma", ".ape"
    };
    static constexpr std::string_view STRM_EXTENSION = ".strm";

    static std::string lowercase_extension(std::string_view filename);
};

}  // namespace lyricflow::scanner
