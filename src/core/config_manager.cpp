#include "filmlist_resolver/core/config_manager.hpp"
#include "filmlist_resolver/utils/config_validator.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/yaml_config.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace filmlist_resolver {
namespace core {

class ConfigManager::Impl {
public:
    explicit Impl(const std::filesystem::path& config_path)
        : m_config_path(config_path.empty() ? default_config_path() : config_path) {
        FILMLIST_LOG_DEBUG("ConfigService", "Initializing with path: " + m_config_path.string());
    }

    std::expected<void, ConfigError> load() {
        FILMLIST_LOG_DEBUG("ConfigService", "Loading configuration");

        m_config = ApplicationConfig{};
        std::expected<void, ConfigError> status{};

        std::error_code ec;
        if (m_config_path.empty() || !std::filesystem::exists(m_config_path, ec)) {
            FILMLIST_LOG_INFO("ConfigService", "Using default configuration");
        } else if (auto loaded = utils::YamlConfigHelper::load_from_file(m_config_path)) {
            auto validation = utils::ConfigValidator::validate_application_config(*loaded);
            for (const auto& warning : validation.warnings) {
                FILMLIST_LOG_WARNING("ConfigService", warning);
            }

            if (validation.is_valid) {
                m_config = std::move(*loaded);
                FILMLIST_LOG_DEBUG("ConfigService", "Configuration loaded");
            } else {
                FILMLIST_LOG_ERROR("ConfigService", "Invalid configuration: " + validation.get_error_summary());
                status = std::unexpected(ConfigError::ValidationError);
            }
        } else {
            FILMLIST_LOG_ERROR("ConfigService", "Could not load " + m_config_path.string() + ": " +
                               to_string(loaded.error()));
            status = std::unexpected(loaded.error());
        }

        if (!status) {
            FILMLIST_LOG_WARNING("ConfigService", "Falling back to default configuration");
        }

        resolve_api_key(m_config.lookup);
        return status;
    }

    const ApplicationConfig& get() const {
        return m_config;
    }

    const std::filesystem::path& path() const {
        return m_config_path;
    }

private:
    std::filesystem::path m_config_path;
    ApplicationConfig m_config;
};

ConfigManager::ConfigManager(const std::filesystem::path& config_path)
    : m_impl(std::make_unique<Impl>(config_path)) {}

ConfigManager::~ConfigManager() = default;

std::expected<void, ConfigError> ConfigManager::load() {
    return m_impl->load();
}

const ApplicationConfig& ConfigManager::get() const {
    return m_impl->get();
}

const std::filesystem::path& ConfigManager::path() const {
    return m_impl->path();
}

std::filesystem::path ConfigManager::default_config_path() {
    if (const char* explicit_path = std::getenv("FILMLIST_CONFIG"); explicit_path && *explicit_path) {
        return explicit_path;
    }

    std::filesystem::path config_dir;
    if (const char* xdg_config = std::getenv("XDG_CONFIG_HOME"); xdg_config && *xdg_config) {
        config_dir = std::filesystem::path(xdg_config) / "filmlist-resolver";
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        config_dir = std::filesystem::path(home) / ".config" / "filmlist-resolver";
    } else {
        return {};
    }

    return config_dir / "config.yaml";
}

void ConfigManager::resolve_api_key(LookupConfig& config) {
    if (!config.api_key.empty()) {
        FILMLIST_LOG_DEBUG("ConfigService", "Using API key from configuration");
        return;
    }

    if (auto key = read_api_key(config.radarr_config_paths)) {
        config.api_key = std::move(*key);
        return;
    }

    FILMLIST_LOG_WARNING("ConfigService", "Could not find a Radarr API key; lookups will be sent without one");
}

std::optional<std::string> ConfigManager::extract_api_key(std::string_view xml) {
    static const std::regex api_key_pattern(R"(<ApiKey>([^<]+)</ApiKey>)");

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(xml.begin(), xml.end(), match, api_key_pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

std::optional<std::string> ConfigManager::read_api_key(const std::vector<std::filesystem::path>& candidates) {
    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        std::ifstream file(candidate);
        if (!file) {
            FILMLIST_LOG_WARNING("ConfigService", "Cannot read Radarr config: " + candidate.string());
            continue;
        }

        std::stringstream content;
        content << file.rdbuf();

        // The first readable file decides; later paths are fallbacks for a missing file only
        if (auto key = extract_api_key(content.str())) {
            FILMLIST_LOG_DEBUG("ConfigService", "Read API key from " + candidate.string());
            return key;
        }
        FILMLIST_LOG_WARNING("ConfigService", "No <ApiKey> element in " + candidate.string());
        return std::nullopt;
    }

    return std::nullopt;
}

} // namespace core
} // namespace filmlist_resolver
