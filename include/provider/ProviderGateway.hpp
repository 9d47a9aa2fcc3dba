#pragma once

#include "model/Track.hpp"
#include <optional>
#include <string>

namespace lyricflow::provider {

// Remote metadata source. nullopt means "the provider has nothing";
// net::ProviderError means the request itself failed.
// Implementations are called concurrently from worker threads.
class ProviderGateway {
public:
    virtual ~ProviderGateway() = default;

    virtual const char* name() const = 0;

    virtual std::optional<model::MatchInfo> search_track(const model::TrackIdentity& identity) = 0;
    virtual std::optional<std::string> fetch_lyrics(const model::MatchInfo& match) = 0;
    virtual std::optional<model::Bytes> fetch_cover(const model::MatchInfo& match) = 0;
};

// Shared acceptance rule for image responses: declared image type or a body
// too large to be an error page.
bool looks_like_image(const std::string& content_type, size_t body_size);

}  // namespace lyricflow::provider
