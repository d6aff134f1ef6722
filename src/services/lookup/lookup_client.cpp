#include "filmlist_resolver/services/lookup/lookup_client.hpp"
#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/utils/json_helper.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/url_utils.hpp"

#include <algorithm>
#include <limits>
#include <regex>

namespace filmlist_resolver {
namespace services {

namespace {
    const std::regex YEAR_RE(R"(\((\d{4})\))");
}

RadarrLookupClient::RadarrLookupClient(std::shared_ptr<HttpClient> http_client, core::LookupConfig config)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config)) {
}

std::vector<core::CandidateMatch> RadarrLookupClient::lookup(const std::string& term) {
    const int target_year = extract_year(term);

    auto result = search(term);
    if (!result) {
        FILMLIST_LOG_ERROR("Lookup", "API error for '" + term + "': " + core::to_string(result.error()));
        return {};
    }

    const size_t raw_count = result->size();
    auto ranked = filter_and_rank(std::move(*result), target_year);

    FILMLIST_LOG_DEBUG("Lookup", "'" + term + "': " + std::to_string(ranked.size()) + " of " +
        std::to_string(raw_count) + " candidates kept");
    return ranked;
}

std::expected<std::vector<core::CandidateMatch>, core::LookupError>
RadarrLookupClient::search(const std::string& term) {
    auto request = RequestBuilder(build_lookup_url(term))
        .method(HttpMethod::GET)
        .header("Accept", "application/json")
        .timeout(m_config.timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response.has_value()) {
        FILMLIST_LOG_ERROR("Lookup", "Request failed for '" + term + "' - " + to_string(response.error()));
        return std::unexpected<core::LookupError>(core::LookupError::NetworkError);
    }

    if (!response->is_success()) {
        FILMLIST_LOG_ERROR("Lookup", "Request for '" + term + "' returned status " +
            std::to_string(response->status()));
        return std::unexpected<core::LookupError>(core::LookupError::HttpError);
    }

    auto json_result = utils::JsonHelper::safe_parse(response->body);
    if (!json_result) {
        FILMLIST_LOG_ERROR("Lookup", "Error parsing response for '" + term + "': " + json_result.error());
        return std::unexpected<core::LookupError>(core::LookupError::ParseError);
    }

    const auto& json_response = json_result.value();
    if (!json_response.is_array()) {
        FILMLIST_LOG_ERROR("Lookup", "Expected a JSON array for '" + term + "'");
        return std::unexpected<core::LookupError>(core::LookupError::InvalidResponse);
    }

    std::vector<core::CandidateMatch> candidates;
    candidates.reserve(json_response.size());
    for (const auto& element : json_response) {
        auto candidate = parse_candidate(element);
        if (!candidate) {
            FILMLIST_LOG_DEBUG("Lookup", "Skipping candidate for '" + term + "': " + candidate.error());
            continue;
        }
        candidates.push_back(std::move(*candidate));
    }

    return candidates;
}

std::string RadarrLookupClient::build_lookup_url(const std::string& term) const {
    return utils::UrlUtils::join_path(m_config.base_url, "lookup") + "?" +
        utils::UrlUtils::build_query_string({{"term", term}, {"apiKey", m_config.api_key}});
}

int RadarrLookupClient::extract_year(const std::string& term) {
    std::smatch match;
    if (std::regex_search(term, match, YEAR_RE)) {
        return std::stoi(match[1].str());
    }
    return kAnyYear;
}

std::vector<core::CandidateMatch> RadarrLookupClient::filter_and_rank(
    std::vector<core::CandidateMatch> candidates, int target_year) {

    std::erase_if(candidates, [target_year](const core::CandidateMatch& candidate) {
        if (!candidate.has_identifier()) {
            return true;
        }
        const bool year_matches = target_year == kAnyYear ||
            candidate.year == target_year ||
            candidate.secondary_year == target_year;
        return !year_matches;
    });

    std::stable_sort(candidates.begin(), candidates.end(),
        [](const core::CandidateMatch& a, const core::CandidateMatch& b) {
            const double pa = a.popularity.value_or(std::numeric_limits<double>::lowest());
            const double pb = b.popularity.value_or(std::numeric_limits<double>::lowest());
            return pa > pb;
        });

    return candidates;
}

std::expected<core::CandidateMatch, std::string> RadarrLookupClient::parse_candidate(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected("candidate is not a JSON object");
    }

    using utils::JsonHelper;

    core::CandidateMatch candidate;
    candidate.title = JsonHelper::get_optional<std::string>(json, "title", "");
    candidate.original_title = JsonHelper::get_optional<std::string>(json, "originalTitle", "");
    candidate.year = JsonHelper::get_nullable<int>(json, "year");
    candidate.secondary_year = JsonHelper::get_nullable<int>(json, "secondaryYear");
    candidate.overview = JsonHelper::get_optional<std::string>(json, "overview", "");
    candidate.imdb_id = JsonHelper::get_optional<std::string>(json, "imdbId", "");
    candidate.tmdb_id = JsonHelper::get_nullable<int>(json, "tmdbId");
    candidate.popularity = JsonHelper::get_nullable<double>(json, "popularity");
    candidate.remote_poster = JsonHelper::get_optional<std::string>(json, "remotePoster", "");

    JsonHelper::for_each_in_array(json, "genres", [&candidate](const nlohmann::json& genre) {
        if (genre.is_string()) {
            candidate.genres.push_back(genre.get<std::string>());
        }
    });

    JsonHelper::for_each_in_array(json, "images", [&candidate](const nlohmann::json& image) {
        if (!image.is_object()) {
            return;
        }
        candidate.images.push_back(core::MovieImage{
            .cover_type = JsonHelper::get_optional<std::string>(image, "coverType", ""),
            .url = JsonHelper::get_optional<std::string>(image, "url", ""),
            .remote_url = JsonHelper::get_optional<std::string>(image, "remoteUrl", "")
        });
    });

    return candidate;
}

} // namespace services
} // namespace filmlist_resolver
