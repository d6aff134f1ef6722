#include "filmlist_resolver/utils/json_helper.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"

namespace filmlist_resolver::utils {

namespace {
    constexpr size_t PREVIEW_LENGTH = 80;

    std::string preview(std::string_view body) {
        auto text = collapse_whitespace(body.substr(0, PREVIEW_LENGTH));
        return body.size() > PREVIEW_LENGTH ? text + "..." : text;
    }
}

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(const std::string& body) {
    const auto start = body.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::unexpected("Empty response body");
    }

    // Error pages from the service or a proxy in front of it
    if (body[start] == '<') {
        return std::unexpected("Response is HTML, not JSON: " + preview(body));
    }

    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected("JSON parse error at byte " + std::to_string(e.byte) + ": " + preview(body));
    }
}

const nlohmann::json* JsonHelper::find_field(const nlohmann::json& json, std::string_view field) {
    if (!json.is_object()) {
        return nullptr;
    }

    auto it = json.find(std::string(field));
    if (it == json.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

} // namespace filmlist_resolver::utils
