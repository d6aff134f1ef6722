#include "test_support.hpp"

#include "filmlist_resolver/services/lookup/lookup_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace filmlist_resolver::tests {
namespace {

using services::RadarrLookupClient;

core::LookupConfig make_config() {
    core::LookupConfig config;
    config.base_url = "http://radarr:7878/api/v3/movie";
    config.api_key = "secret";
    config.timeout = std::chrono::seconds{12};
    return config;
}

nlohmann::json radarr_movie(const std::string& title, int year, const std::string& imdb_id,
                            std::optional<int> tmdb_id = std::nullopt,
                            std::optional<double> popularity = std::nullopt) {
    nlohmann::json movie = {
        {"title", title},
        {"originalTitle", title},
        {"year", year},
        {"imdbId", imdb_id}
    };
    if (tmdb_id) movie["tmdbId"] = *tmdb_id;
    if (popularity) movie["popularity"] = *popularity;
    return movie;
}

std::shared_ptr<FakeHttpClient> serving(int status, std::string body) {
    return std::make_shared<FakeHttpClient>([status, body](const HttpRequest&) {
        return std::expected<HttpResponse, NetworkError>(make_response(status, body));
    });
}

TEST(RadarrLookupClientTest, BuildsEncodedLookupUrl) {
    RadarrLookupClient client(serving(200, "[]"), make_config());

    EXPECT_EQ(client.build_lookup_url("Amélie (2001)"),
              "http://radarr:7878/api/v3/movie/lookup?term=Am%C3%A9lie%20%282001%29&apiKey=secret");
}

TEST(RadarrLookupClientTest, ExtractsYearFromParentheses) {
    EXPECT_EQ(RadarrLookupClient::extract_year("Heat (1995)"), 1995);
    EXPECT_EQ(RadarrLookupClient::extract_year("Blade Runner 2049 (2017)"), 2017);
    EXPECT_EQ(RadarrLookupClient::extract_year("Heat"), RadarrLookupClient::kAnyYear);
    EXPECT_EQ(RadarrLookupClient::extract_year("Heat (95)"), RadarrLookupClient::kAnyYear);
}

TEST(RadarrLookupClientTest, SendsGetWithConfiguredTimeout) {
    auto http = serving(200, "[]");
    RadarrLookupClient client(http, make_config());

    client.lookup("Heat (1995)");

    auto requests = http->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, services::HttpMethod::GET);
    EXPECT_EQ(requests[0].timeout, std::chrono::seconds{12});
    EXPECT_NE(requests[0].url.find("term=Heat%20%281995%29"), std::string::npos);
}

TEST(RadarrLookupClientTest, KeepsIdentifiedCandidatesOfTheTargetYearByPopularity) {
    auto no_ids = radarr_movie("No Ids", 1995, "");
    auto secondary = radarr_movie("Secondary", 1994, "", 42, 50.0);
    secondary["secondaryYear"] = 1995;

    nlohmann::json body = nlohmann::json::array({
        radarr_movie("Popular", 1995, "tt001", std::nullopt, 10.0),
        no_ids,
        secondary,
        radarr_movie("Wrong Year", 2000, "tt002", std::nullopt, 99.0),
        radarr_movie("Unrated", 1995, "tt003")
    });

    RadarrLookupClient client(serving(200, body.dump()), make_config());
    auto candidates = client.lookup("Heat (1995)");

    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].title, "Secondary");
    EXPECT_EQ(candidates[1].title, "Popular");
    EXPECT_EQ(candidates[2].title, "Unrated");
}

TEST(RadarrLookupClientTest, TermWithoutYearAcceptsAnyYear) {
    nlohmann::json body = nlohmann::json::array({
        radarr_movie("Old", 1950, "tt1"),
        radarr_movie("New", 2020, "tt2")
    });

    RadarrLookupClient client(serving(200, body.dump()), make_config());

    EXPECT_EQ(client.lookup("Heat").size(), 2u);
}

TEST(RadarrLookupClientTest, EqualPopularityKeepsResponseOrder) {
    nlohmann::json body = nlohmann::json::array({
        radarr_movie("First", 1995, "tt1", std::nullopt, 5.0),
        radarr_movie("Second", 1995, "tt2", std::nullopt, 5.0),
        radarr_movie("Third", 1995, "tt3", std::nullopt, 5.0)
    });

    RadarrLookupClient client(serving(200, body.dump()), make_config());
    auto candidates = client.lookup("Heat (1995)");

    ASSERT_EQ(candidates.size(), 3u);
    EXPECT_EQ(candidates[0].title, "First");
    EXPECT_EQ(candidates[1].title, "Second");
    EXPECT_EQ(candidates[2].title, "Third");
}

TEST(RadarrLookupClientTest, FailuresYieldNoCandidates) {
    auto offline = std::make_shared<FakeHttpClient>([](const HttpRequest&) {
        return std::expected<HttpResponse, NetworkError>(std::unexpected(NetworkError::Timeout));
    });

    EXPECT_TRUE(RadarrLookupClient(offline, make_config()).lookup("Heat (1995)").empty());
    EXPECT_TRUE(RadarrLookupClient(serving(500, "oops"), make_config()).lookup("Heat (1995)").empty());
    EXPECT_TRUE(RadarrLookupClient(serving(200, "not json"), make_config()).lookup("Heat (1995)").empty());
    EXPECT_TRUE(RadarrLookupClient(serving(200, R"({"title":"Heat"})"), make_config()).lookup("Heat (1995)").empty());
}

TEST(RadarrLookupClientTest, SearchReportsErrorKinds) {
    auto offline = std::make_shared<FakeHttpClient>([](const HttpRequest&) {
        return std::expected<HttpResponse, NetworkError>(std::unexpected(NetworkError::ConnectionFailed));
    });

    EXPECT_EQ(RadarrLookupClient(offline, make_config()).search("x").error(), core::LookupError::NetworkError);
    EXPECT_EQ(RadarrLookupClient(serving(404, ""), make_config()).search("x").error(), core::LookupError::HttpError);
    EXPECT_EQ(RadarrLookupClient(serving(200, "{"), make_config()).search("x").error(), core::LookupError::ParseError);
    EXPECT_EQ(RadarrLookupClient(serving(200, "{}"), make_config()).search("x").error(),
              core::LookupError::InvalidResponse);
}

TEST(RadarrLookupClientTest, SkipsArrayElementsThatAreNotObjects) {
    nlohmann::json body = nlohmann::json::array({42, "text", radarr_movie("Heat", 1995, "tt0113277")});

    RadarrLookupClient client(serving(200, body.dump()), make_config());
    auto candidates = client.lookup("Heat (1995)");

    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].imdb_id, "tt0113277");
}

TEST(RadarrLookupClientTest, ParsesRadarrMovieFields) {
    nlohmann::json movie = {
        {"title", "Heat"},
        {"originalTitle", "Heat"},
        {"year", 1995},
        {"secondaryYear", nullptr},
        {"imdbId", "tt0113277"},
        {"tmdbId", 949},
        {"popularity", 42.5},
        {"remotePoster", "https://image.tmdb.org/heat.jpg"},
        {"genres", nlohmann::json::array({"Action", "Crime"})},
        {"overview", "A group of professional bank robbers..."},
        {"images", nlohmann::json::array({
            nlohmann::json{{"coverType", "poster"}, {"url", "/poster.jpg"}, {"remoteUrl", "https://image.tmdb.org/p.jpg"}},
            nlohmann::json{{"coverType", "fanart"}, {"remoteUrl", "https://image.tmdb.org/f.jpg"}}
        })}
    };

    auto parsed = RadarrLookupClient::parse_candidate(movie);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->title, "Heat");
    EXPECT_EQ(parsed->year, 1995);
    EXPECT_FALSE(parsed->secondary_year.has_value());
    EXPECT_EQ(parsed->tmdb_id, 949);
    EXPECT_DOUBLE_EQ(parsed->popularity.value_or(0.0), 42.5);
    EXPECT_EQ(parsed->genres, (std::vector<std::string>{"Action", "Crime"}));
    ASSERT_EQ(parsed->images.size(), 2u);
    EXPECT_EQ(parsed->images[0].cover_type, "poster");
    EXPECT_EQ(parsed->images[0].remote_url, "https://image.tmdb.org/p.jpg");
    EXPECT_TRUE(parsed->images[1].url.empty());
}

TEST(RadarrLookupClientTest, OutOfRangeNumbersAreTreatedAsMissing) {
    nlohmann::json movie = {
        {"title", "Broken"},
        {"year", 1e30},
        {"secondaryYear", -1e30},
        {"imdbId", ""},
        {"tmdbId", 1e30}
    };

    auto parsed = RadarrLookupClient::parse_candidate(movie);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_FALSE(parsed->year.has_value());
    EXPECT_FALSE(parsed->secondary_year.has_value());
    EXPECT_FALSE(parsed->tmdb_id.has_value());
    EXPECT_FALSE(parsed->has_identifier());
}

TEST(RadarrLookupClientTest, CandidateWithOutOfRangeIdIsDropped) {
    nlohmann::json bogus = {{"title", "Bogus"}, {"year", 1995}, {"imdbId", ""}, {"tmdbId", 3e9}};
    nlohmann::json body = nlohmann::json::array({bogus, radarr_movie("Heat", 1995, "tt0113277")});

    RadarrLookupClient client(serving(200, body.dump()), make_config());
    auto candidates = client.lookup("Heat (1995)");

    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].title, "Heat");
}

} // namespace
} // namespace filmlist_resolver::tests
