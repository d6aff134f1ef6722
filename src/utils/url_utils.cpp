#include "filmlist_resolver/utils/url_utils.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"

namespace filmlist_resolver {
namespace utils {

namespace {
    constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    bool is_unreserved(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '-' || c == '_' || c == '.' || c == '~';
    }
}

std::string UrlUtils::encode(std::string_view str) {
    std::string encoded;
    encoded.reserve(str.size() * 3);

    for (char c : str) {
        const auto uc = static_cast<unsigned char>(c);
        if (is_unreserved(uc)) {
            encoded += c;
        } else {
            encoded += '%';
            encoded += HEX_DIGITS[uc >> 4];
            encoded += HEX_DIGITS[uc & 0x0F];
        }
    }

    return encoded;
}

std::string UrlUtils::join_path(std::string_view base, std::string_view path) {
    if (base.empty()) return std::string(path);
    if (path.empty()) return std::string(base);

    if (base.back() == '/') {
        base.remove_suffix(1);
    }
    if (path.front() == '/') {
        path.remove_prefix(1);
    }

    std::string joined(base);
    joined += '/';
    joined += path;
    return joined;
}

std::string UrlUtils::build_query_string(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += encode(key);
        query += '=';
        query += encode(value);
    }
    return query;
}

bool UrlUtils::is_valid_url(std::string_view url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return false;
    }

    const auto scheme = url.substr(0, scheme_end);
    if (!equals_ignore_case(scheme, "http") && !equals_ignore_case(scheme, "https")) {
        return false;
    }

    const auto rest = url.substr(scheme_end + 3);
    const auto host = rest.substr(0, rest.find_first_of("/?#"));
    return !host.empty() && host.find_first_of(" \t\r\n") == std::string_view::npos;
}

} // namespace utils
} // namespace filmlist_resolver
