#include "backend/AudioTagStore.hpp"
#include "backend/MetadataParser.hpp"
#include "backend/TagEditor.hpp"
#include "util/Logger.hpp"

namespace lyricflow::backend {

std::optional<BasicTags> AudioTagStore::read_basic(const std::string& path) const {
    return MetadataParser::read_basic_tags(path);
}

bool AudioTagStore::supports_embedding(const std::string& path) const {
    return TagEditor::is_embeddable(path);
}

EmbeddedTagState AudioTagStore::probe(const std::string& path) const {
    EmbeddedTagState state;
    if (!TagEditor::is_embeddable(path)) {
        return state;
    }
    state.lyrics = TagEditor::has_embedded_lyrics(path);
    state.cover = TagEditor::has_embedded_cover(path);
    if (auto tags = MetadataParser::read_basic_tags(path)) {
        state.basic_info = tags->complete();
    }
    return state;
}

bool AudioTagStore::write_tags(const std::string& path, const TagUpdate& update) {
    if (!TagEditor::write(path, update)) {
        util::Logger::error("AudioTagStore: Tag write failed for " + path);
        return false;
    }
    return true;
}

}  // namespace lyricflow::backend
