#include "core/IdentityResolver.hpp"
#include "util/Logger.hpp"

namespace lyricflow::core {

namespace {
    constexpr std::string_view SEPARATOR = " - ";

    void fill_if_empty(std::string& field, const std::string& value) {
        if (field.empty() && !value.empty()) {
            field = value;
        }
    }
}

IdentityResolver::IdentityResolver(const backend::TagStore& tags, bool use_folder_structure, std::string default_artist)
    : tags_(tags), use_folder_structure_(use_folder_structure), default_artist_(trim(default_artist)) {}

std::string IdentityResolver::trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

std::optional<std::pair<std::string, std::string>> IdentityResolver::split_artist_title(std::string_view stem) {
    const auto pos = stem.find(SEPARATOR);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }

    std::string artist = trim(stem.substr(0, pos));
    std::string title = trim(stem.substr(pos + SEPARATOR.size()));
    if (artist.empty() || title.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(artist), std::move(title));
}

model::TrackIdentity IdentityResolver::resolve(const model::TrackCandidate& candidate) const {
    model::TrackIdentity identity;

    // 1. Embedded tags
    switch (candidate.kind) {
        case model::TrackKind::AudioFile:
            if (auto basic = tags_.read_basic(candidate.absolute_path)) {
                identity.artist = trim(basic->artist);
                identity.album = trim(basic->album);
                identity.title = trim(basic->title);
            }
            break;
        case model::TrackKind::StrmFile:
            break;
    }

    // 2. Folder structure
    const auto& chain = candidate.folder_chain;
    if (use_folder_structure_ && !chain.empty()) {
        if (chain.size() >= 2) {
            fill_if_empty(identity.album, chain[chain.size() - 1]);
            fill_if_empty(identity.artist, chain[chain.size() - 2]);
        } else {
            fill_if_empty(identity.artist, chain.front());
        }
    }

    // 3. Filename stem
    if (identity.title.empty()) {
        std::string stem = trim(candidate.raw_filename_stem);
        std::optional<std::pair<std::string, std::string>> split;

        switch (candidate.kind) {
            case model::TrackKind::StrmFile:
                split = split_artist_title(stem);
                break;
            case model::TrackKind::AudioFile:
                break;
        }

        if (split) {
            if (stem.find(SEPARATOR, stem.find(SEPARATOR) + SEPARATOR.size()) != std::string::npos) {
                util::Logger::debug("Identity: Ambiguous separators in '" + stem +
                                    "', using first as artist/title boundary");
            }
            fill_if_empty(identity.artist, split->first);
            identity.title = std::move(split->second);
        } else {
            identity.title = stem;
        }
    }

    // Stems made only of whitespace still need a title
    if (identity.title.empty()) {
        identity.title = candidate.raw_filename_stem;
    }

    // 4. Default artist
    fill_if_empty(identity.artist, default_artist_);

    return identity;
}

}  // namespace lyricflow::core
