#include "provider/TuneHubProvider.hpp"
#include "util/Logger.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace lyricflow::provider {

using json = nlohmann::json;

namespace {
    // Platforms return ids as strings or numbers depending on the source
    std::string field(const json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return "";
        if (it->is_string()) return it->get<std::string>();
        if (it->is_number_integer()) return std::to_string(it->get<long long>());
        return it->dump();
    }
}

TuneHubProvider::TuneHubProvider(net::HttpTransport& http, std::string base_url, std::vector<std::string> platforms)
    : http_(http), base_url_(std::move(base_url)), platforms_(std::move(platforms)) {}

std::vector<model::MatchInfo> TuneHubProvider::parse_search_response(const std::string& body) {
    json data;
    try {
        data = json::parse(body);
    } catch (const json::parse_error& e) {
        throw net::ProviderError(std::string("TuneHub: Invalid JSON in search response: ") + e.what());
    }

    std::vector<model::MatchInfo> results;
    if (!data.is_object() || !data.contains("code") || data["code"] != 200) {
        util::Logger::warn("TuneHub: API returned non-200 code: " + data.dump().substr(0, 200));
        return results;
    }

    auto data_it = data.find("data");
    if (data_it == data.end() || !data_it->is_object()) return results;
    auto list_it = data_it->find("results");
    if (list_it == data_it->end() || !list_it->is_array()) return results;

    for (const auto& item : *list_it) {
        if (!item.is_object()) continue;
        model::MatchInfo info;
        info.id = field(item, "id");
        info.title = field(item, "name");
        info.artist = field(item, "artist");
        info.album = field(item, "album");
        info.platform = field(item, "platform");
        info.lyrics_url = field(item, "lrc");
        info.cover_url = field(item, "pic");
        results.push_back(std::move(info));
    }
    return results;
}

int TuneHubProvider::score(const model::MatchInfo& result,
                           const model::TrackIdentity& identity,
                           const std::vector<std::string>& platforms) {
    const std::string want_title = util::normalize_for_match(identity.title);
    const std::string want_artist = util::normalize_for_match(identity.artist);
    const std::string got_title = util::normalize_for_match(result.title);
    const std::string got_artist = util::normalize_for_match(result.artist);

    int total = 0;
    if (got_title == want_title) {
        total += 100;
    } else if (got_title.find(want_title) != std::string::npos) {
        total += 50;
    }

    if (got_artist.find(want_artist) != std::string::npos ||
        want_artist.find(got_artist) != std::string::npos) {
        total += 30;
    }

    auto it = std::find(platforms.begin(), platforms.end(), result.platform);
    if (it != platforms.end()) {
        total += 10 - static_cast<int>(std::distance(platforms.begin(), it));
    }
    return total;
}

std::optional<model::MatchInfo> TuneHubProvider::pick_best_match(
    const std::vector<model::MatchInfo>& results,
    const model::TrackIdentity& identity,
    const std::vector<std::string>& platforms
) {
    const model::MatchInfo* best = nullptr;
    int best_score = 0;
    for (const auto& result : results) {
        int s = score(result, identity, platforms);
        // Strictly greater keeps the earliest of equally scored results
        if (!best || s > best_score) {
            best = &result;
            best_score = s;
        }
    }

    if (!best || best_score < MIN_SCORE) {
        return std::nullopt;
    }
    return *best;
}

std::optional<model::MatchInfo> TuneHubProvider::search_track(const model::TrackIdentity& identity) {
    std::string keyword = identity.artist.empty() ? identity.title : identity.artist + " " + identity.title;
    if (keyword.find_first_not_of(' ') == std::string::npos) {
        return std::nullopt;
    }

    util::Logger::info("TuneHub: Searching for: " + keyword);
    auto response = http_.get(net::build_url(base_url_ + "/api/", {
        {"type", "aggregateSearch"},
        {"keyword", keyword},
    }));
    if (response.not_found()) {
        return std::nullopt;
    }

    auto results = parse_search_response(response.body);
    auto best = pick_best_match(results, identity, platforms_);
    if (!best) {
        util::Logger::debug("TuneHub: No good match among " + std::to_string(results.size()) +
                            " results for " + keyword);
    }
    return best;
}

std::optional<std::string> TuneHubProvider::fetch_lyrics(const model::MatchInfo& match) {
    if (match.lyrics_url.empty()) return std::nullopt;

    util::Logger::info("TuneHub: Fetching lyrics from " + match.platform + ": " + match.title);
    auto response = http_.get(match.lyrics_url);
    if (response.not_found()) return std::nullopt;

    // An error object instead of LRC text means no lyrics
    if (response.body.empty() || response.body.front() == '{') {
        return std::nullopt;
    }
    return response.body;
}

std::optional<model::Bytes> TuneHubProvider::fetch_cover(const model::MatchInfo& match) {
    if (match.cover_url.empty()) return std::nullopt;

    util::Logger::info("TuneHub: Fetching cover from " + match.platform + ": " + match.title);
    auto response = http_.get(match.cover_url);
    if (response.not_found() || response.body.empty()) return std::nullopt;

    if (!looks_like_image(response.content_type, response.body.size())) {
        util::Logger::warn("TuneHub: Non-image cover response for " + match.title);
        return std::nullopt;
    }
    return model::Bytes(response.body.begin(), response.body.end());
}

}  // namespace lyricflow::provider
