#pragma once

#include "model/Track.hpp"
#include <optional>
#include <string>

namespace lyricflow::backend {

struct BasicTags {
    std::string artist;
    std::string title;
    std::string album;

    bool complete() const { return !artist.empty() && !title.empty() && !album.empty(); }
};

struct EmbeddedTagState {
    bool lyrics = false;
    bool cover = false;
    bool basic_info = false;
};

// Fields to write into a file's own tags. Unset fields are left untouched.
struct TagUpdate {
    std::optional<std::string> lyrics;
    std::optional<model::Bytes> cover;
    std::optional<std::string> artist;
    std::optional<std::string> title;
    std::optional<std::string> album;

    bool empty() const { return !lyrics && !cover && !artist && !title && !album; }
};

// Narrow read/write access to an audio file's tags.
// Implementations must be safe to call from several worker threads on different files.
class TagStore {
public:
    virtual ~TagStore() = default;

    // nullopt when the file cannot be parsed as audio
    virtual std::optional<BasicTags> read_basic(const std::string& path) const = 0;

    // False for containers this tool never writes tags into
    virtual bool supports_embedding(const std::string& path) const = 0;

    virtual EmbeddedTagState probe(const std::string& path) const = 0;

    // Applies all fields in one save. Returns false on failure; the file is left as it was.
    virtual bool write_tags(const std::string& path, const TagUpdate& update) = 0;
};

}  // namespace lyricflow::backend
