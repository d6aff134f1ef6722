#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>

namespace filmlist_resolver {
namespace services {

// The lookup API is read with GET, the translation API with GET (health check) and POST
enum class HttpMethod {
    GET,
    POST
};

enum class HttpStatus {
    OK = 200,
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    TooManyRequests = 429,
    InternalServerError = 500,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504
};

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    DNSResolutionFailed,
    SSLError,
    InvalidUrl,
    TooManyRedirects,
    BadResponse
};

std::string to_string(NetworkError error);
std::string to_string(HttpMethod method);

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    std::chrono::seconds timeout{30};

    bool is_valid() const;
};

struct HttpResponse {
    HttpStatus status_code = HttpStatus::OK;
    HttpHeaders headers;
    std::string body;
    std::chrono::milliseconds response_time{0};

    int status() const { return static_cast<int>(status_code); }
    bool is_success() const;
    bool is_client_error() const;
    bool is_server_error() const;

    // Header names compare case-insensitively
    std::optional<std::string> get_header(const std::string& name) const;
};

} // namespace services
} // namespace filmlist_resolver
