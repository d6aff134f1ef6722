#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <expected>

namespace filmlist_resolver {
namespace utils {

class YamlConfigHelper {
public:
    // FileNotFound, PermissionDenied (unreadable) or InvalidFormat (syntax or mistyped value)
    static std::expected<core::ApplicationConfig, core::ConfigError>
    load_from_file(const std::filesystem::path& path);

    // Missing keys keep their defaults. Throws YAML::Exception on mistyped values.
    static core::ApplicationConfig from_yaml(const YAML::Node& node);

private:
    static core::LookupConfig parse_lookup_config(const YAML::Node& node);
    static core::TranslationConfig parse_translation_config(const YAML::Node& node);
    static core::PipelineConfig parse_pipeline_config(const YAML::Node& node);
    static core::IoConfig parse_io_config(const YAML::Node& node);
};

} // namespace utils
} // namespace filmlist_resolver
