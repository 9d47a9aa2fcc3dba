#pragma once

#include "net/HttpClient.hpp"
#include "provider/ProviderGateway.hpp"
#include <string>

namespace lyricflow::provider {

/**
 * Self-hosted LrcApi server (https://github.com/HisAtri/LrcApi).
 *
 * LrcApi has no search endpoint: it answers lyrics/cover requests directly
 * from title/artist/album. search_track() therefore returns a synthetic match
 * carrying the query, and the fetches send it as parameters.
 *
 * lyrics:  GET {base}/lyrics?title=&artist=
 * cover:   GET {base}/cover?title=&album=&artist=
 */
class LrcApiProvider : public ProviderGateway {
public:
    LrcApiProvider(net::HttpTransport& http, std::string base_url, std::string auth_key);

    const char* name() const override { return "lrcapi"; }

    std::optional<model::MatchInfo> search_track(const model::TrackIdentity& identity) override;
    std::optional<std::string> fetch_lyrics(const model::MatchInfo& match) override;
    std::optional<model::Bytes> fetch_cover(const model::MatchInfo& match) override;

    const std::string& base_url() const { return base_url_; }
    net::HttpHeaders request_headers() const;

    std::string lyrics_url(const model::MatchInfo& match) const;
    std::string cover_url(const model::MatchInfo& match) const;

    // LRC text has bracketed tags and is never a JSON error object
    static bool is_valid_lyrics(const std::string& body);

private:
    net::HttpTransport& http_;
    std::string base_url_;
    std::string auth_key_;
};

}  // namespace lyricflow::provider
