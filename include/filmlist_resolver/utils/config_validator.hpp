#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <string>
#include <utility>
#include <vector>

namespace filmlist_resolver::utils {

/**
 * @brief Configuration validation errors
 */
enum class ValidationError {
    InvalidUrl,
    InvalidConcurrency,
    InvalidRetryConfig,
    InvalidTimeout,
    InvalidLanguage,
    MissingRequiredField
};

/**
 * @brief Detailed validation result
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<std::pair<ValidationError, std::string>> errors;
    std::vector<std::string> warnings;

    void add_error(ValidationError error, const std::string& message) {
        is_valid = false;
        errors.emplace_back(error, message);
    }

    void add_warning(const std::string& message) {
        warnings.emplace_back(message);
    }

    void merge(const ValidationResult& other) {
        errors.insert(errors.end(), other.errors.begin(), other.errors.end());
        warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
        is_valid = is_valid && other.is_valid;
    }

    std::string get_error_summary() const {
        std::string summary;
        for (const auto& [error, message] : errors) {
            if (!summary.empty()) summary += "; ";
            summary += message;
        }
        return summary;
    }

    std::string get_warning_summary() const {
        std::string summary;
        for (const auto& warning : warnings) {
            if (!summary.empty()) summary += "; ";
            summary += warning;
        }
        return summary;
    }
};

class ConfigValidator {
public:
    static ValidationResult validate_lookup_config(const core::LookupConfig& config);
    static ValidationResult validate_translation_config(const core::TranslationConfig& config);
    static ValidationResult validate_pipeline_config(const core::PipelineConfig& config);
    static ValidationResult validate_io_config(const core::IoConfig& config);
    static ValidationResult validate_application_config(const core::ApplicationConfig& config);

    /**
     * @brief Validate language code format (two or three lowercase letters)
     */
    static bool is_valid_language_code(const std::string& code);
};

} // namespace filmlist_resolver::utils
