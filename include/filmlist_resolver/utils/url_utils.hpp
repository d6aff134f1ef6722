#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace filmlist_resolver {
namespace utils {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

class UrlUtils {
public:
    // RFC 3986 percent-encoding; only unreserved characters pass through
    static std::string encode(std::string_view str);

    static std::string join_path(std::string_view base, std::string_view path);

    // Parameters keep their given order
    static std::string build_query_string(const QueryParams& params);

    // http or https with a non-empty host
    static bool is_valid_url(std::string_view url);
};

} // namespace utils
} // namespace filmlist_resolver
