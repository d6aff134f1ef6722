#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace filmlist_resolver {
namespace services {

class HttpClient;

// Movie metadata search. lookup() never throws; failures yield an empty result.
class ILookupClient {
public:
    virtual ~ILookupClient() = default;

    virtual std::vector<core::CandidateMatch> lookup(const std::string& term) = 0;
};

// Radarr /movie/lookup client
class RadarrLookupClient : public ILookupClient {
public:
    // Target year meaning "accept any year"
    static constexpr int kAnyYear = 0;

    RadarrLookupClient(std::shared_ptr<HttpClient> http_client, core::LookupConfig config);

    std::vector<core::CandidateMatch> lookup(const std::string& term) override;

    // Raw fetch + parse, without filtering
    std::expected<std::vector<core::CandidateMatch>, core::LookupError> search(const std::string& term);

    std::string build_lookup_url(const std::string& term) const;

    // Year inside "(dddd)", or kAnyYear
    static int extract_year(const std::string& term);

    // Keeps identified candidates matching the year, most popular first
    static std::vector<core::CandidateMatch> filter_and_rank(
        std::vector<core::CandidateMatch> candidates, int target_year);

    static std::expected<core::CandidateMatch, std::string> parse_candidate(const nlohmann::json& json);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::LookupConfig m_config;
};

} // namespace services
} // namespace filmlist_resolver
