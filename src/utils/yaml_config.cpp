#include "filmlist_resolver/utils/yaml_config.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include <algorithm>

namespace filmlist_resolver {
namespace utils {

namespace {
    bool is_known_log_level(const std::string& level) {
        static const std::vector<std::string> valid_levels = {
            "debug", "info", "warning", "warn", "error", "none"
        };
        return std::find(valid_levels.begin(), valid_levels.end(), level) != valid_levels.end();
    }
}

std::expected<core::ApplicationConfig, core::ConfigError>
YamlConfigHelper::load_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        FILMLIST_LOG_WARNING("YamlConfig", "File not found: " + path.string());
        return std::unexpected(core::ConfigError::FileNotFound);
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::BadFile& e) {
        FILMLIST_LOG_ERROR("YamlConfig", "Cannot read file: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::PermissionDenied);
    } catch (const std::exception& e) {
        FILMLIST_LOG_ERROR("YamlConfig", "Parse error: " + std::string(e.what()));
        return std::unexpected(core::ConfigError::InvalidFormat);
    }
}

core::ApplicationConfig YamlConfigHelper::from_yaml(const YAML::Node& node) {
    core::ApplicationConfig config;

    if (node["log_level"]) {
        auto level = node["log_level"].as<std::string>();
        if (is_known_log_level(level)) {
            config.log_level = log_level_from_string(level);
        } else {
            FILMLIST_LOG_WARNING("YamlConfig", "Unknown log level '" + level + "', using info");
        }
    }
    if (node["log_file"]) {
        config.log_file = node["log_file"].as<std::string>();
    }

    if (node["lookup"]) {
        config.lookup = parse_lookup_config(node["lookup"]);
    }
    if (node["translation"]) {
        config.translation = parse_translation_config(node["translation"]);
    }
    if (node["pipeline"]) {
        config.pipeline = parse_pipeline_config(node["pipeline"]);
    }
    if (node["io"]) {
        config.io = parse_io_config(node["io"]);
    }

    return config;
}

core::LookupConfig YamlConfigHelper::parse_lookup_config(const YAML::Node& node) {
    core::LookupConfig config;

    if (node["base_url"]) {
        config.base_url = node["base_url"].as<std::string>();
    }
    if (node["api_key"]) {
        config.api_key = node["api_key"].as<std::string>();
    }
    if (node["radarr_config_paths"]) {
        config.radarr_config_paths.clear();
        for (const auto& path : node["radarr_config_paths"]) {
            config.radarr_config_paths.emplace_back(path.as<std::string>());
        }
    }
    if (node["timeout"]) {
        config.timeout = std::chrono::seconds{node["timeout"].as<int>()};
    }

    return config;
}

core::TranslationConfig YamlConfigHelper::parse_translation_config(const YAML::Node& node) {
    core::TranslationConfig config;

    if (node["base_url"]) {
        config.base_url = node["base_url"].as<std::string>();
    }
    if (node["source_language"]) {
        config.source_language = node["source_language"].as<std::string>();
    }
    if (node["target_language"]) {
        config.target_language = node["target_language"].as<std::string>();
    }
    if (node["max_attempts"]) {
        config.max_attempts = node["max_attempts"].as<int>();
    }
    if (node["base_delay_ms"]) {
        config.base_delay = std::chrono::milliseconds{node["base_delay_ms"].as<int>()};
    }
    if (node["timeout"]) {
        config.timeout = std::chrono::seconds{node["timeout"].as<int>()};
    }

    return config;
}

core::PipelineConfig YamlConfigHelper::parse_pipeline_config(const YAML::Node& node) {
    core::PipelineConfig config;

    // Read as signed so that negative values reach the validator instead of wrapping
    if (node["max_concurrency"]) {
        config.max_concurrency = static_cast<std::size_t>(std::max(0, node["max_concurrency"].as<int>()));
    }
    if (node["worker_threads"]) {
        config.worker_threads = static_cast<std::size_t>(std::max(0, node["worker_threads"].as<int>()));
    }

    return config;
}

core::IoConfig YamlConfigHelper::parse_io_config(const YAML::Node& node) {
    core::IoConfig config;

    if (node["input_dir"]) {
        config.input_dir = node["input_dir"].as<std::string>();
    }
    if (node["output_dir"]) {
        config.output_dir = node["output_dir"].as<std::string>();
    }
    if (node["default_input"]) {
        config.default_input = node["default_input"].as<std::string>();
    }

    return config;
}

} // namespace utils
} // namespace filmlist_resolver
