#include "../framework/SimpleTest.hpp"
#include "../framework/Fakes.hpp"
#include "provider/LrcApiProvider.hpp"
#include "provider/TuneHubProvider.hpp"

using namespace lyricflow;
using lyricflow::provider::LrcApiProvider;
using lyricflow::provider::TuneHubProvider;

namespace {
    const std::vector<std::string> PLATFORMS = {"netease", "kuwo", "qq"};

    const char* SEARCH_BODY = R"({
        "code": 200,
        "data": {
            "results": [
                {"id": 1, "name": "Fantasy Remix", "artist": "DJ Someone", "album": "Club", "platform": "qq",
                 "lrc": "http://lrc/1", "pic": "http://pic/1"},
                {"id": "186016", "name": "Fantasy", "artist": "Jay Chou", "album": "Fantasy", "platform": "kuwo",
                 "lrc": "http://lrc/2", "pic": "http://pic/2"},
                {"id": "5257138", "name": "Fantasy", "artist": "Jay Chou", "album": "Fantasy", "platform": "netease",
                 "lrc": "http://lrc/3", "pic": "http://pic/3"}
            ]
        }
    })";

    model::TrackIdentity identity(const std::string& artist, const std::string& title, const std::string& album = "") {
        model::TrackIdentity id;
        id.artist = artist;
        id.title = title;
        id.album = album;
        return id;
    }

    std::string search_url(const std::string& keyword) {
        return net::build_url("https://hub.example/api/", {{"type", "aggregateSearch"}, {"keyword", keyword}});
    }
}

// --- TuneHub ---

TEST_CASE(test_tunehub_parse_results) {
    auto results = TuneHubProvider::parse_search_response(SEARCH_BODY);
    ASSERT_EQ(results.size(), 3u);
    ASSERT_EQ(results[0].id, "1");
    ASSERT_EQ(results[1].id, "186016");
    ASSERT_EQ(results[1].lyrics_url, "http://lrc/2");
    ASSERT_EQ(results[2].platform, "netease");
}

TEST_CASE(test_tunehub_parse_error_code) {
    auto results = TuneHubProvider::parse_search_response(R"({"code": 500, "msg": "busy"})");
    ASSERT_TRUE(results.empty());
}

TEST_CASE(test_tunehub_parse_invalid_json_throws) {
    ASSERT_THROWS(TuneHubProvider::parse_search_response("<html>502</html>"), net::ProviderError);
}

TEST_CASE(test_tunehub_score_components) {
    model::MatchInfo exact;
    exact.title = "Fantasy";
    exact.artist = "Jay Chou";
    exact.platform = "netease";
    ASSERT_EQ(TuneHubProvider::score(exact, identity("Jay Chou", "Fantasy"), PLATFORMS), 140);

    model::MatchInfo substring = exact;
    substring.title = "Fantasy (Live)";
    substring.platform = "qq";
    ASSERT_EQ(TuneHubProvider::score(substring, identity("Jay Chou", "Fantasy"), PLATFORMS), 88);

    model::MatchInfo unrelated = exact;
    unrelated.title = "Other";
    unrelated.artist = "Someone";
    unrelated.platform = "spotify";
    ASSERT_EQ(TuneHubProvider::score(unrelated, identity("Jay Chou", "Fantasy"), PLATFORMS), 0);
}

TEST_CASE(test_tunehub_score_ignores_case_and_accents) {
    model::MatchInfo result;
    result.title = "Café Del Mar";
    result.artist = "Energy 52";
    ASSERT_EQ(TuneHubProvider::score(result, identity("energy 52", "cafe del mar"), {}), 130);
}

TEST_CASE(test_tunehub_best_match_prefers_platform_priority) {
    auto results = TuneHubProvider::parse_search_response(SEARCH_BODY);
    auto best = TuneHubProvider::pick_best_match(results, identity("Jay Chou", "Fantasy"), PLATFORMS);
    ASSERT_TRUE(best.has_value());
    ASSERT_EQ(best->platform, "netease");
    ASSERT_EQ(best->id, "5257138");
}

TEST_CASE(test_tunehub_below_threshold_is_no_match) {
    auto results = TuneHubProvider::parse_search_response(SEARCH_BODY);
    auto best = TuneHubProvider::pick_best_match(results, identity("Nobody", "Nothing"), {});
    ASSERT_FALSE(best.has_value());
}

TEST_CASE(test_tunehub_search_over_transport) {
    test::FakeTransport http;
    http.responses[search_url("Jay Chou Fantasy")] = net::HttpResponse{200, SEARCH_BODY, "application/json"};
    TuneHubProvider provider(http, "https://hub.example", PLATFORMS);

    auto match = provider.search_track(identity("Jay Chou", "Fantasy"));
    ASSERT_TRUE(match.has_value());
    ASSERT_EQ(match->lyrics_url, "http://lrc/3");
    ASSERT_EQ(http.requests.size(), 1u);
}

TEST_CASE(test_tunehub_search_title_only_keyword) {
    test::FakeTransport http;
    http.responses[search_url("Fantasy")] = net::HttpResponse{200, R"({"code":200,"data":{"results":[]}})", ""};
    TuneHubProvider provider(http, "https://hub.example", PLATFORMS);

    ASSERT_FALSE(provider.search_track(identity("", "Fantasy")).has_value());
    ASSERT_EQ(http.requests.size(), 1u);
    ASSERT_EQ(http.requests[0].url, search_url("Fantasy"));
}

TEST_CASE(test_tunehub_fetch_lyrics) {
    test::FakeTransport http;
    http.responses["http://lrc/3"] = net::HttpResponse{200, "[00:01.00]La la", "text/plain"};
    http.responses["http://lrc/4"] = net::HttpResponse{200, R"({"error":"no lyrics"})", "application/json"};
    TuneHubProvider provider(http, "https://hub.example", PLATFORMS);

    model::MatchInfo match;
    match.lyrics_url = "http://lrc/3";
    auto lyrics = provider.fetch_lyrics(match);
    ASSERT_TRUE(lyrics.has_value());
    ASSERT_EQ(*lyrics, "[00:01.00]La la");

    match.lyrics_url = "http://lrc/4";
    ASSERT_FALSE(provider.fetch_lyrics(match).has_value());

    match.lyrics_url = "http://lrc/missing";
    ASSERT_FALSE(provider.fetch_lyrics(match).has_value());
}

TEST_CASE(test_tunehub_fetch_cover_acceptance) {
    test::FakeTransport http;
    http.responses["http://pic/typed"] = net::HttpResponse{200, "tiny", "image/jpeg"};
    http.responses["http://pic/large"] = net::HttpResponse{200, std::string(1001, 'x'), "application/octet-stream"};
    http.responses["http://pic/page"] = net::HttpResponse{200, "<html>not found</html>", "text/html"};
    TuneHubProvider provider(http, "https://hub.example", PLATFORMS);

    model::MatchInfo match;
    match.cover_url = "http://pic/typed";
    ASSERT_TRUE(provider.fetch_cover(match).has_value());
    match.cover_url = "http://pic/large";
    ASSERT_EQ(provider.fetch_cover(match)->size(), 1001u);
    match.cover_url = "http://pic/page";
    ASSERT_FALSE(provider.fetch_cover(match).has_value());
}

TEST_CASE(test_tunehub_transport_error_propagates) {
    test::FakeTransport http;
    http.throw_on_unknown = true;
    TuneHubProvider provider(http, "https://hub.example", PLATFORMS);

    ASSERT_THROWS(provider.search_track(identity("Jay", "Fantasy")), net::ProviderError);
}

// --- LrcApi ---

TEST_CASE(test_lrcapi_synthetic_search) {
    test::FakeTransport http;
    LrcApiProvider provider(http, "http://lrc.local/", "");

    auto match = provider.search_track(identity("Jay", "Fantasy", "Fantasy"));
    ASSERT_TRUE(match.has_value());
    ASSERT_EQ(match->title, "Fantasy");
    ASSERT_EQ(match->platform, "lrcapi");
    ASSERT_TRUE(http.requests.empty());

    ASSERT_FALSE(provider.search_track(identity("Jay", "")).has_value());
    ASSERT_EQ(provider.base_url(), "http://lrc.local");
}

TEST_CASE(test_lrcapi_urls_omit_empty_params) {
    test::FakeTransport http;
    LrcApiProvider provider(http, "http://lrc.local", "");

    auto full = *provider.search_track(identity("Jay", "Fantasy", "Fantasy"));
    ASSERT_EQ(provider.cover_url(full),
              net::build_url("http://lrc.local/cover", {{"title", "Fantasy"}, {"album", "Fantasy"}, {"artist", "Jay"}}));

    auto no_album = *provider.search_track(identity("Jay", "Fantasy"));
    ASSERT_EQ(provider.cover_url(no_album),
              net::build_url("http://lrc.local/cover", {{"title", "Fantasy"}, {"artist", "Jay"}}));
    ASSERT_EQ(provider.lyrics_url(no_album),
              net::build_url("http://lrc.local/lyrics", {{"title", "Fantasy"}, {"artist", "Jay"}}));
}

TEST_CASE(test_lrcapi_auth_header) {
    test::FakeTransport http;
    LrcApiProvider with_key(http, "http://lrc.local", "secret");
    LrcApiProvider without_key(http, "http://lrc.local", "");

    ASSERT_EQ(with_key.request_headers().at("Authorization"), "secret");
    ASSERT_TRUE(without_key.request_headers().empty());

    auto match = *with_key.search_track(identity("Jay", "Fantasy"));
    with_key.fetch_lyrics(match);
    ASSERT_EQ(http.requests.size(), 1u);
    ASSERT_EQ(http.requests[0].headers.at("Authorization"), "secret");
}

TEST_CASE(test_lrcapi_lyrics_validation) {
    ASSERT_TRUE(LrcApiProvider::is_valid_lyrics("[00:01.00]La la"));
    ASSERT_FALSE(LrcApiProvider::is_valid_lyrics("plain text without tags"));
    ASSERT_FALSE(LrcApiProvider::is_valid_lyrics(R"({"error":"[missing]"})"));
    ASSERT_FALSE(LrcApiProvider::is_valid_lyrics(""));
}

TEST_CASE(test_lrcapi_fetch_over_transport) {
    test::FakeTransport http;
    LrcApiProvider provider(http, "http://lrc.local", "");
    auto match = *provider.search_track(identity("Jay", "Fantasy", "Fantasy"));
    http.responses[provider.lyrics_url(match)] = net::HttpResponse{200, "[00:01.00]La la", "text/plain"};
    http.responses[provider.cover_url(match)] = net::HttpResponse{200, "\xFF\xD8\xFF", "image/jpeg"};

    ASSERT_EQ(*provider.fetch_lyrics(match), "[00:01.00]La la");
    auto cover = provider.fetch_cover(match);
    ASSERT_TRUE(cover.has_value());
    ASSERT_EQ(cover->size(), 3u);

    auto unknown = *provider.search_track(identity("Nobody", "Nothing"));
    ASSERT_FALSE(provider.fetch_lyrics(unknown).has_value());
    ASSERT_FALSE(provider.fetch_cover(unknown).has_value());
}

int main() {
    return lyricflow::test::TestRunner::instance().run_all();
}
