#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace filmlist_resolver {
namespace services {

class HttpClient;

/**
 * @brief Attempt counter with exponential backoff
 *
 * Starts in Attempting at attempt 0. Each failed attempt either moves to the
 * next attempt, yielding the delay to wait first (base * 2^attempt), or ends in
 * Exhausted once max_attempts have been made.
 */
class RetrySchedule {
public:
    enum class State {
        Attempting,
        Succeeded,
        Exhausted
    };

    RetrySchedule(int max_attempts, std::chrono::milliseconds base_delay);

    int attempt() const { return m_attempt; }
    int max_attempts() const { return m_max_attempts; }
    State state() const { return m_state; }
    bool is_first_attempt() const { return m_attempt == 0; }

    std::chrono::milliseconds delay_for(int attempt) const;

    // Delay before the next attempt, or nullopt when no attempt is left
    std::optional<std::chrono::milliseconds> record_failure();
    void record_success();

private:
    int m_max_attempts;
    std::chrono::milliseconds m_base_delay;
    int m_attempt = 0;
    State m_state = State::Attempting;
};

// Text translation. translate() never fails; it returns the input when it cannot translate.
class ITranslator {
public:
    virtual ~ITranslator() = default;

    virtual std::string translate(const std::string& text,
                                  const std::string& source_language,
                                  const std::string& target_language) = 0;
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

// LibreTranslate REST client with health probe and retries
class LibreTranslateClient : public ITranslator {
public:
    LibreTranslateClient(std::shared_ptr<HttpClient> http_client,
                         core::TranslationConfig config,
                         SleepFunction sleep = nullptr);

    std::string translate(const std::string& text,
                          const std::string& source_language,
                          const std::string& target_language) override;

    std::expected<void, core::TranslationError> check_health();

    // Single attempt; a response without translatedText yields the input text
    std::expected<std::string, core::TranslationError> request_translation(
        const std::string& text,
        const std::string& source_language,
        const std::string& target_language);

private:
    std::shared_ptr<HttpClient> m_http_client;
    core::TranslationConfig m_config;
    SleepFunction m_sleep;
};

} // namespace services
} // namespace filmlist_resolver
