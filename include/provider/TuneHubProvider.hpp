#pragma once

#include "net/HttpClient.hpp"
#include "provider/ProviderGateway.hpp"
#include <string>
#include <vector>

namespace lyricflow::provider {

/**
 * TuneHub aggregate search across several streaming platforms.
 *
 * search:  GET {base}/api/?type=aggregateSearch&keyword=<artist title>
 * lyrics:  GET <result.lrc>   (plain LRC text)
 * cover:   GET <result.pic>   (image bytes)
 */
class TuneHubProvider : public ProviderGateway {
public:
    TuneHubProvider(net::HttpTransport& http, std::string base_url, std::vector<std::string> platforms);

    const char* name() const override { return "tunehub"; }

    std::optional<model::MatchInfo> search_track(const model::TrackIdentity& identity) override;
    std::optional<std::string> fetch_lyrics(const model::MatchInfo& match) override;
    std::optional<model::Bytes> fetch_cover(const model::MatchInfo& match) override;

    // Parses an aggregateSearch body. A non-200 "code" yields no results;
    // a body that is not JSON throws net::ProviderError.
    static std::vector<model::MatchInfo> parse_search_response(const std::string& body);

    // Highest-scoring result, or nullopt when the best score is below MIN_SCORE
    static std::optional<model::MatchInfo> pick_best_match(
        const std::vector<model::MatchInfo>& results,
        const model::TrackIdentity& identity,
        const std::vector<std::string>& platforms
    );

    static int score(const model::MatchInfo& result,
                     const model::TrackIdentity& identity,
                     const std::vector<std::string>& platforms);

    static constexpr int MIN_SCORE = 30;

private:
    net::HttpTransport& http_;
    std::string base_url_;
    std::vector<std::string> platforms_;
};

}  // namespace lyricflow::provider
