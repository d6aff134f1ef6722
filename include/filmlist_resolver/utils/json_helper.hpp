#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace filmlist_resolver::utils {

/**
 * @brief Tolerant access to JSON returned by remote services
 *
 * Radarr and LibreTranslate both answer with HTML error pages behind some
 * proxies, and many movie fields are optional or null. Lookups here never
 * throw: a missing, null or mistyped field is reported as absent.
 */
class JsonHelper {
public:
    /**
     * @brief Parse a response body
     *
     * @return The document, or a message that includes the start of the body
     */
    static std::expected<nlohmann::json, std::string> safe_parse(const std::string& body);

    // Field value, or default_value when absent
    template<typename T>
    static T get_optional(const nlohmann::json& json, std::string_view field, const T& default_value);

    template<typename T>
    static std::optional<T> get_nullable(const nlohmann::json& json, std::string_view field);

    // Calls func for each element of an array field; does nothing if the field is not an array
    template<typename Func>
    static void for_each_in_array(const nlohmann::json& json, std::string_view field, Func&& func);

private:
    // nullptr unless json is an object holding a non-null field
    static const nlohmann::json* find_field(const nlohmann::json& json, std::string_view field);

    // Whether a JSON number converts to T without leaving T's range (NaN never does)
    template<typename T>
    static bool fits_integral(const nlohmann::json& value);
};

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, std::string_view field, const T& default_value) {
    return get_nullable<T>(json, field).value_or(default_value);
}

template<typename T>
std::optional<T> JsonHelper::get_nullable(const nlohmann::json& json, std::string_view field) {
    const auto* value = find_field(json, field);
    if (!value) {
        return std::nullopt;
    }

    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (value->is_number() && !fits_integral<T>(*value)) {
            return std::nullopt;
        }
    }

    try {
        return value->get<T>();
    } catch (const nlohmann::json::type_error&) {
        return std::nullopt;
    }
}

template<typename T>
bool JsonHelper::fits_integral(const nlohmann::json& value) {
    using limits = std::numeric_limits<T>;

    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(limits::max());
    }
    if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        if constexpr (std::is_unsigned_v<T>) {
            return number >= 0 && static_cast<std::uint64_t>(number) <= static_cast<std::uint64_t>(limits::max());
        } else {
            return number >= static_cast<std::int64_t>(limits::min()) &&
                   number <= static_cast<std::int64_t>(limits::max());
        }
    }

    // min and max + 1 are zero or powers of two, so both bounds are exact doubles
    const double number = value.get<double>();
    const double lower = static_cast<double>(limits::min());
    const double upper = (static_cast<double>(limits::max() / 2) + 1.0) * 2.0;
    return number >= lower && number < upper;
}

template<typename Func>
void JsonHelper::for_each_in_array(const nlohmann::json& json, std::string_view field, Func&& func) {
    const auto* value = find_field(json, field);
    if (!value || !value->is_array()) {
        return;
    }

    for (const auto& element : *value) {
        func(element);
    }
}

} // namespace filmlist_resolver::utils
