#pragma once

#include "filmlist_resolver/core/models.hpp"
#include "filmlist_resolver/services/lookup/lookup_client.hpp"
#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/services/translation/translator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace filmlist_resolver::tests {

using services::HttpRequest;
using services::HttpResponse;
using services::NetworkError;

inline HttpResponse make_response(int status, std::string body) {
    HttpResponse response;
    response.status_code = static_cast<services::HttpStatus>(status);
    response.body = std::move(body);
    return response;
}

// Scripted HttpClient; every request goes through execute() and is recorded
class FakeHttpClient : public services::HttpClient {
public:
    using Handler = std::function<std::expected<HttpResponse, NetworkError>(const HttpRequest&)>;

    explicit FakeHttpClient(Handler handler) : m_handler(std::move(handler)) {}

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        {
            std::lock_guard lock(m_mutex);
            m_requests.push_back(request);
        }
        return m_handler(request);
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard lock(m_mutex);
        return m_requests;
    }

    size_t count(services::HttpMethod method) const {
        std::lock_guard lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_requests.begin(), m_requests.end(),
            [method](const HttpRequest& request) { return request.method == method; }));
    }

private:
    Handler m_handler;
    mutable std::mutex m_mutex;
    std::vector<HttpRequest> m_requests;
};

inline core::CandidateMatch make_candidate(std::string title,
                                           std::optional<int> year,
                                           std::string imdb_id,
                                           std::optional<int> tmdb_id = std::nullopt,
                                           std::optional<double> popularity = std::nullopt) {
    core::CandidateMatch candidate;
    candidate.title = std::move(title);
    candidate.year = year;
    candidate.imdb_id = std::move(imdb_id);
    candidate.tmdb_id = tmdb_id;
    candidate.popularity = popularity;
    return candidate;
}

// Canned lookup results keyed by the exact term; tracks overlapping calls
class FakeLookupClient : public services::ILookupClient {
public:
    std::map<std::string, std::vector<core::CandidateMatch>> results;
    std::set<std::string> failing_terms;
    std::chrono::milliseconds latency{0};

    std::vector<core::CandidateMatch> lookup(const std::string& term) override {
        const int now = ++m_current;
        int seen = m_max_seen.load();
        while (now > seen && !m_max_seen.compare_exchange_weak(seen, now)) {
        }

        {
            std::lock_guard lock(m_mutex);
            m_calls.push_back(term);
        }

        if (latency.count() > 0) {
            std::this_thread::sleep_for(latency);
        }
        --m_current;

        if (failing_terms.contains(term)) {
            throw std::runtime_error("lookup exploded");
        }

        auto it = results.find(term);
        return it == results.end() ? std::vector<core::CandidateMatch>{} : it->second;
    }

    std::vector<std::string> calls() const {
        std::lock_guard lock(m_mutex);
        return m_calls;
    }

    int max_concurrent_calls() const { return m_max_seen.load(); }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_calls;
    std::atomic<int> m_current{0};
    std::atomic<int> m_max_seen{0};
};

class FakeTranslator : public services::ITranslator {
public:
    std::map<std::string, std::string> translations;

    std::string translate(const std::string& text,
                          const std::string& source_language,
                          const std::string& target_language) override {
        ++m_calls;
        {
            std::lock_guard lock(m_mutex);
            m_last_pair = source_language + "->" + target_language;
        }
        auto it = translations.find(text);
        return it == translations.end() ? text : it->second;
    }

    int calls() const { return m_calls.load(); }

    std::string last_pair() const {
        std::lock_guard lock(m_mutex);
        return m_last_pair;
    }

private:
    std::atomic<int> m_calls{0};
    mutable std::mutex m_mutex;
    std::string m_last_pair;
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "filmlist_resolver_";
        if (info) {
            name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
        }
        name += std::to_string(::getpid());
        m_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace filmlist_resolver::tests
