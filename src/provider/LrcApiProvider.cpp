#include "provider/LrcApiProvider.hpp"
#include "util/Logger.hpp"

namespace lyricflow::provider {

LrcApiProvider::LrcApiProvider(net::HttpTransport& http, std::string base_url, std::string auth_key)
    : http_(http), base_url_(std::move(base_url)), auth_key_(std::move(auth_key)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

net::HttpHeaders LrcApiProvider::request_headers() const {
    net::HttpHeaders headers;
    if (!auth_key_.empty()) {
        headers["Authorization"] = auth_key_;
    }
    return headers;
}

std::string LrcApiProvider::lyrics_url(const model::MatchInfo& match) const {
    net::QueryParams params;
    if (!match.title.empty()) params.emplace_back("title", match.title);
    if (!match.artist.empty()) params.emplace_back("artist", match.artist);
    return net::build_url(base_url_ + "/lyrics", params);
}

std::string LrcApiProvider::cover_url(const model::MatchInfo& match) const {
    // title+album+artist: song cover, album+artist: album cover, artist: avatar
    net::QueryParams params;
    if (!match.title.empty()) params.emplace_back("title", match.title);
    if (!match.album.empty()) params.emplace_back("album", match.album);
    if (!match.artist.empty()) params.emplace_back("artist", match.artist);
    return net::build_url(base_url_ + "/cover", params);
}

bool LrcApiProvider::is_valid_lyrics(const std::string& body) {
    return !body.empty() && body.find('[') != std::string::npos && body.front() != '{';
}

std::optional<model::MatchInfo> LrcApiProvider::search_track(const model::TrackIdentity& identity) {
    if (identity.title.empty()) {
        return std::nullopt;
    }

    model::MatchInfo match;
    match.id = identity.artist + "_" + identity.title + "_" + identity.album;
    match.title = identity.title;
    match.artist = identity.artist;
    match.album = identity.album;
    match.platform = "lrcapi";

    util::Logger::info("LrcApi: Search: " + identity.artist + " - " + identity.title);
    return match;
}

std::optional<std::string> LrcApiProvider::fetch_lyrics(const model::MatchInfo& match) {
    util::Logger::info("LrcApi: Fetching lyrics: " + match.artist + " - " + match.title);

    auto response = http_.get(lyrics_url(match), request_headers());
    if (response.not_found()) {
        return std::nullopt;
    }
    if (!is_valid_lyrics(response.body)) {
        util::Logger::warn("LrcApi: Invalid lyrics returned for " + match.title);
        return std::nullopt;
    }
    return response.body;
}

std::optional<model::Bytes> LrcApiProvider::fetch_cover(const model::MatchInfo& match) {
    util::Logger::info("LrcApi: Fetching cover: " + match.artist + " - " + match.title);

    auto response = http_.get(cover_url(match), request_headers());
    if (response.not_found() || response.body.empty()) {
        return std::nullopt;
    }
    if (!looks_like_image(response.content_type, response.body.size())) {
        util::Logger::warn("LrcApi: Non-image content returned for " + match.title);
        return std::nullopt;
    }
    return model::Bytes(response.body.begin(), response.body.end());
}

}  // namespace lyricflow::provider
