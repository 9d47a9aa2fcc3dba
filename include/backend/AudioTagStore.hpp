#pragma once

#include "backend/TagStore.hpp"

namespace lyricflow::backend {

// Production TagStore: MetadataParser for basic tags, TagEditor for lyrics/cover.
class AudioTagStore : public TagStore {
public:
    std::optional<BasicTags> read_basic(const std::string& path) const override;
    bool supports_embedding(const std::string& path) const override;
    EmbeddedTagState probe(const std::string& path) const override;
    bool write_tags(const std::string& path, const TagUpdate& update) override;
};

}  // namespace lyricflow::backend
