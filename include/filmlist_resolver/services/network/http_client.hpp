#pragma once

#include "filmlist_resolver/services/network/http_types.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace filmlist_resolver {
namespace services {

// Blocking HTTP client shared by all pipeline tasks. execute() must be safe to call concurrently.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Any HTTP status is a response; only transport failures are errors
    virtual std::expected<HttpResponse, NetworkError> execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    std::chrono::seconds connect_timeout{10};
    std::string user_agent = "filmlist-resolver";
    bool follow_redirects = true;
    long max_redirects = 5;
    bool verify_ssl = true;

    bool is_valid() const;
};

class RequestBuilder {
public:
    explicit RequestBuilder(std::string url);

    RequestBuilder& method(HttpMethod method);
    RequestBuilder& header(const std::string& name, const std::string& value);
    RequestBuilder& json_body(std::string json);
    RequestBuilder& timeout(std::chrono::seconds timeout);

    HttpRequest build() const;

private:
    HttpRequest m_request;
};

// libcurl-backed client
std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace filmlist_resolver
