#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"
#include "filmlist_resolver/utils/url_utils.hpp"

#include <algorithm>

namespace filmlist_resolver {
namespace services {

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "Connection failed";
        case NetworkError::Timeout: return "Timeout";
        case NetworkError::DNSResolutionFailed: return "DNS resolution failed";
        case NetworkError::SSLError: return "SSL error";
        case NetworkError::InvalidUrl: return "Invalid URL";
        case NetworkError::TooManyRedirects: return "Too many redirects";
        case NetworkError::BadResponse: return "Bad response";
        default: return "Unknown error";
    }
}

std::string to_string(HttpMethod method) {
    return method == HttpMethod::POST ? "POST" : "GET";
}

bool HttpRequest::is_valid() const {
    return utils::UrlUtils::is_valid_url(url) && timeout.count() > 0;
}

bool HttpResponse::is_success() const {
    return status() >= 200 && status() < 300;
}

bool HttpResponse::is_client_error() const {
    return status() >= 400 && status() < 500;
}

bool HttpResponse::is_server_error() const {
    return status() >= 500 && status() < 600;
}

std::optional<std::string> HttpResponse::get_header(const std::string& name) const {
    auto it = std::find_if(headers.begin(), headers.end(),
        [&name](const auto& pair) { return utils::equals_ignore_case(pair.first, name); });
    return it != headers.end() ? std::make_optional(it->second) : std::nullopt;
}

bool HttpClientConfig::is_valid() const {
    return connect_timeout.count() > 0 && max_redirects >= 0;
}

RequestBuilder::RequestBuilder(std::string url) {
    m_request.url = std::move(url);
}

RequestBuilder& RequestBuilder::method(HttpMethod method) {
    m_request.method = method;
    return *this;
}

RequestBuilder& RequestBuilder::header(const std::string& name, const std::string& value) {
    m_request.headers[name] = value;
    return *this;
}

RequestBuilder& RequestBuilder::json_body(std::string json) {
    m_request.body = std::move(json);
    m_request.headers["Content-Type"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::seconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

HttpRequest RequestBuilder::build() const {
    return m_request;
}

} // namespace services
} // namespace filmlist_resolver
