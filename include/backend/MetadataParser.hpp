#pragma once

#include "backend/TagStore.hpp"
#include <optional>
#include <string>

namespace lyricflow::backend {

enum class AudioFormat {
    Unknown,
    MP3,
    FLAC,
    OGG,
    WAV,
    M4A,
    WMA,
    APE,
};

class MetadataParser {
public:
    // Read artist/title/album. nullopt when the file is not parseable audio;
    // a parseable file without tags yields empty fields.
    static std::optional<BasicTags> read_basic_tags(const std::string& path);

    // Determine audio format from extension
    static AudioFormat detect_format(const std::string& path);

private:
    // Helper parsers using native libraries
    static bool parse_mp3(const std::string& path, BasicTags& tags);
    static bool parse_sndfile(const std::string& path, BasicTags& tags);
    static bool parse_avformat(const std::string& path, BasicTags& tags);
};

}  // namespace lyricflow::backend
