#include "filmlist_resolver/services/translation/translator.hpp"
#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/utils/json_helper.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/url_utils.hpp"

#include <algorithm>
#include <thread>

namespace filmlist_resolver {
namespace services {

// RetrySchedule implementation
RetrySchedule::RetrySchedule(int max_attempts, std::chrono::milliseconds base_delay)
    : m_max_attempts(std::max(max_attempts, 1))
    , m_base_delay(base_delay) {
}

std::chrono::milliseconds RetrySchedule::delay_for(int attempt) const {
    return m_base_delay * (1LL << std::clamp(attempt, 0, 30));
}

std::optional<std::chrono::milliseconds> RetrySchedule::record_failure() {
    if (m_state != State::Attempting) {
        return std::nullopt;
    }

    if (m_attempt + 1 >= m_max_attempts) {
        m_state = State::Exhausted;
        return std::nullopt;
    }

    const auto delay = delay_for(m_attempt);
    ++m_attempt;
    return delay;
}

void RetrySchedule::record_success() {
    if (m_state == State::Attempting) {
        m_state = State::Succeeded;
    }
}

// LibreTranslateClient implementation
LibreTranslateClient::LibreTranslateClient(std::shared_ptr<HttpClient> http_client,
                                           core::TranslationConfig config,
                                           SleepFunction sleep)
    : m_http_client(std::move(http_client))
    , m_config(std::move(config))
    , m_sleep(std::move(sleep)) {
    if (!m_sleep) {
        m_sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::string LibreTranslateClient::translate(const std::string& text,
                                            const std::string& source_language,
                                            const std::string& target_language) {
    RetrySchedule schedule(m_config.max_attempts, m_config.base_delay);
    const std::string attempts_total = std::to_string(schedule.max_attempts());

    while (schedule.state() == RetrySchedule::State::Attempting) {
        const std::string attempt_label = std::to_string(schedule.attempt() + 1) + "/" + attempts_total;

        if (schedule.is_first_attempt()) {
            FILMLIST_LOG_DEBUG("Translator", "Testing translation service connection...");
            auto health = check_health();
            if (!health) {
                FILMLIST_LOG_WARNING("Translator", "Health check failed: " + core::to_string(health.error()));
            }
        }

        FILMLIST_LOG_INFO("Translator", "Attempting to translate '" + text + "' (attempt " + attempt_label + ")");
        auto result = request_translation(text, source_language, target_language);
        if (result) {
            schedule.record_success();
            FILMLIST_LOG_INFO("Translator", "Translation successful: '" + text + "' -> '" + *result + "'");
            return *result;
        }

        FILMLIST_LOG_WARNING("Translator", "Translation of '" + text + "' failed (attempt " + attempt_label +
            "): " + core::to_string(result.error()));

        if (auto delay = schedule.record_failure()) {
            FILMLIST_LOG_INFO("Translator", "Waiting " + std::to_string(delay->count()) + "ms before retry...");
            m_sleep(*delay);
        }
    }

    FILMLIST_LOG_WARNING("Translator", "Translation failed after " + attempts_total +
        " attempts. Returning original title: '" + text + "'");
    return text;
}

std::expected<void, core::TranslationError> LibreTranslateClient::check_health() {
    auto request = RequestBuilder(utils::UrlUtils::join_path(m_config.base_url, "/"))
        .method(HttpMethod::GET)
        .timeout(m_config.timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response.has_value()) {
        return std::unexpected<core::TranslationError>(core::TranslationError::NetworkError);
    }

    if (!response->is_success()) {
        FILMLIST_LOG_WARNING("Translator", "Health check returned status " + std::to_string(response->status()));
        return std::unexpected<core::TranslationError>(core::TranslationError::HttpError);
    }

    return {};
}

std::expected<std::string, core::TranslationError> LibreTranslateClient::request_translation(
    const std::string& text,
    const std::string& source_language,
    const std::string& target_language) {

    const nlohmann::json payload = {
        {"q", text},
        {"source", source_language},
        {"target", target_language},
        {"format", "text"}
    };

    auto request = RequestBuilder(utils::UrlUtils::join_path(m_config.base_url, "translate"))
        .method(HttpMethod::POST)
        .json_body(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace))
        .header("Accept", "application/json")
        .timeout(m_config.timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response.has_value()) {
        FILMLIST_LOG_ERROR("Translator", "HTTP request failed: " + to_string(response.error()));
        return std::unexpected<core::TranslationError>(core::TranslationError::NetworkError);
    }

    if (!response->is_success()) {
        FILMLIST_LOG_ERROR("Translator", "Translation failed with status: " + std::to_string(response->status()));
        FILMLIST_LOG_ERROR("Translator", "Error response: " + response->body);
        return std::unexpected<core::TranslationError>(core::TranslationError::HttpError);
    }

    auto json_result = utils::JsonHelper::safe_parse(response->body);
    if (!json_result) {
        FILMLIST_LOG_ERROR("Translator", "Error parsing response: " + json_result.error());
        return std::unexpected<core::TranslationError>(core::TranslationError::ParseError);
    }

    return utils::JsonHelper::get_optional<std::string>(*json_result, "translatedText", text);
}

} // namespace services
} // namespace filmlist_resolver
