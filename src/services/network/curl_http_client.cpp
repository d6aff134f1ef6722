#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"
#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <mutex>

namespace filmlist_resolver {
namespace services {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    static_cast<std::string*>(userdata)->append(data, total);
    return total;
}

// Keeps "Name: value" lines; the status line and the blank terminator have no colon
size_t write_header(char* data, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    const std::string_view line(data, total);

    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        auto& headers = *static_cast<HttpHeaders*>(userdata);
        headers[std::string(line.substr(0, colon))] = utils::trim(line.substr(colon + 1));
    }
    return total;
}

// curl_global_init is not thread-safe; run it once per process
void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

NetworkError to_network_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return NetworkError::DNSResolutionFailed;
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return NetworkError::ConnectionFailed;
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_PEER_FAILED_VERIFICATION:
            return NetworkError::SSLError;
        case CURLE_TOO_MANY_REDIRECTS:
            return NetworkError::TooManyRedirects;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return NetworkError::InvalidUrl;
        default:
            return NetworkError::BadResponse;
    }
}

} // namespace

class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config) : m_config(std::move(config)) {
        ensure_curl_initialized();
    }

    std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) override {
        if (!request.is_valid()) {
            FILMLIST_LOG_ERROR("CurlHttpClient", "Invalid request URL: " + request.url);
            return std::unexpected<NetworkError>(NetworkError::InvalidUrl);
        }

        // One easy handle per request keeps concurrent pipeline tasks independent
        CurlEasyPtr curl(curl_easy_init());
        if (!curl) {
            FILMLIST_LOG_ERROR("CurlHttpClient", "Failed to initialize curl handle");
            return std::unexpected<NetworkError>(NetworkError::ConnectionFailed);
        }

        HttpResponse response;
        char error_buffer[CURL_ERROR_SIZE] = {};
        CurlSlistPtr header_list = build_header_list(request);

        CURL* handle = curl.get();
        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");

        if (request.method == HttpMethod::POST) {
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        } else {
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
        }

        curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_config.connect_timeout.count()));
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, m_config.follow_redirects ? 1L : 0L);
        curl_easy_setopt(handle, CURLOPT_MAXREDIRS, m_config.max_redirects);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, m_config.verify_ssl ? 1L : 0L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, m_config.verify_ssl ? 2L : 0L);
        if (!m_config.user_agent.empty()) {
            curl_easy_setopt(handle, CURLOPT_USERAGENT, m_config.user_agent.c_str());
        }

        const auto started = std::chrono::steady_clock::now();
        const CURLcode res = curl_easy_perform(handle);
        response.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (res != CURLE_OK) {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(res);
            FILMLIST_LOG_ERROR("CurlHttpClient", to_string(request.method) + " " + request.url + " failed: " + detail);
            return std::unexpected<NetworkError>(to_network_error(res));
        }

        long response_code = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code);
        response.status_code = static_cast<HttpStatus>(response_code);

        FILMLIST_LOG_DEBUG("CurlHttpClient", to_string(request.method) + " " + request.url + " -> " +
            std::to_string(response_code) + " in " + std::to_string(response.response_time.count()) + "ms");
        return response;
    }

private:
    static CurlSlistPtr build_header_list(const HttpRequest& request) {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : request.headers) {
            const std::string line = name + ": " + value;
            curl_slist* appended = curl_slist_append(list, line.c_str());
            if (!appended) {
                break;
            }
            list = appended;
        }
        return CurlSlistPtr(list);
    }

    HttpClientConfig m_config;
};

std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config) {
    if (!config.is_valid()) {
        FILMLIST_LOG_WARNING("CurlHttpClient", "Invalid HTTP client configuration, using defaults");
        return std::make_unique<CurlHttpClient>(HttpClientConfig{});
    }
    return std::make_unique<CurlHttpClient>(config);
}

} // namespace services
} // namespace filmlist_resolver
