#pragma once

#include "backend/TagStore.hpp"
#include <string>

namespace lyricflow::backend {

// Embedded lyrics and cover access through TagLib.
// MP3 uses ID3v2 USLT/APIC frames, FLAC and OGG Vorbis use the LYRICS comment
// plus FLAC picture blocks, M4A uses the ©lyr and covr atoms.
class TagEditor {
public:
    static bool is_embeddable(const std::string& path);

    static bool has_embedded_lyrics(const std::string& path);
    static bool has_embedded_cover(const std::string& path);

    // Replaces any existing lyrics/pictures; one save per call
    static bool write(const std::string& path, const TagUpdate& update);

private:
    enum class Container { None, MP3, FLAC, M4A, OGG };
    static Container container_for(const std::string& path);
};

}  // namespace lyricflow::backend
