#include "filmlist_resolver/utils/config_validator.hpp"
#include "filmlist_resolver/utils/url_utils.hpp"
#include <algorithm>
#include <cctype>

namespace filmlist_resolver::utils {

ValidationResult ConfigValidator::validate_lookup_config(const core::LookupConfig& config) {
    ValidationResult result;

    if (!UrlUtils::is_valid_url(config.base_url)) {
        result.add_error(ValidationError::InvalidUrl,
            "Invalid lookup URL: " + config.base_url);
    }

    if (config.timeout < std::chrono::seconds{1}) {
        result.add_error(ValidationError::InvalidTimeout,
            "Lookup timeout must be at least 1 second");
    }

    if (config.api_key.empty() && config.radarr_config_paths.empty()) {
        result.add_warning("No API key and no Radarr config paths; lookups will be unauthenticated");
    }

    return result;
}

ValidationResult ConfigValidator::validate_translation_config(const core::TranslationConfig& config) {
    ValidationResult result;

    if (!UrlUtils::is_valid_url(config.base_url)) {
        result.add_error(ValidationError::InvalidUrl,
            "Invalid translation URL: " + config.base_url);
    }

    if (!is_valid_language_code(config.source_language)) {
        result.add_error(ValidationError::InvalidLanguage,
            "Invalid source language: '" + config.source_language + "'");
    }
    if (!is_valid_language_code(config.target_language)) {
        result.add_error(ValidationError::InvalidLanguage,
            "Invalid target language: '" + config.target_language + "'");
    }

    if (config.max_attempts < 1) {
        result.add_error(ValidationError::InvalidRetryConfig,
            "Translation attempts must be at least 1");
    } else if (config.max_attempts > 10) {
        result.add_warning("More than 10 translation attempts may stall slow titles for minutes");
    }

    if (config.base_delay < std::chrono::milliseconds{0}) {
        result.add_error(ValidationError::InvalidRetryConfig,
            "Translation retry delay cannot be negative");
    }

    if (config.timeout < std::chrono::seconds{1}) {
        result.add_error(ValidationError::InvalidTimeout,
            "Translation timeout must be at least 1 second");
    }

    return result;
}

ValidationResult ConfigValidator::validate_pipeline_config(const core::PipelineConfig& config) {
    ValidationResult result;

    if (config.max_concurrency < 1) {
        result.add_error(ValidationError::InvalidConcurrency,
            "max_concurrency must be at least 1");
    }
    if (config.worker_threads < 1) {
        result.add_error(ValidationError::InvalidConcurrency,
            "worker_threads must be at least 1");
    }

    if (result.is_valid && config.worker_threads < config.max_concurrency) {
        result.add_warning("worker_threads is below max_concurrency; fewer titles than allowed will run at once");
    }

    return result;
}

ValidationResult ConfigValidator::validate_io_config(const core::IoConfig& config) {
    ValidationResult result;

    if (config.default_input.empty()) {
        result.add_error(ValidationError::MissingRequiredField,
            "io.default_input cannot be empty");
    }
    if (config.output_dir.empty()) {
        result.add_error(ValidationError::MissingRequiredField,
            "io.output_dir cannot be empty");
    }

    return result;
}

ValidationResult ConfigValidator::validate_application_config(const core::ApplicationConfig& config) {
    ValidationResult result;

    result.merge(validate_lookup_config(config.lookup));
    result.merge(validate_translation_config(config.translation));
    result.merge(validate_pipeline_config(config.pipeline));
    result.merge(validate_io_config(config.io));

    return result;
}

bool ConfigValidator::is_valid_language_code(const std::string& code) {
    if (code.size() < 2 || code.size() > 3) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return std::islower(c) != 0;
    });
}

} // namespace filmlist_resolver::utils
