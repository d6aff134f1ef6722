#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace filmlist_resolver {
namespace core {

/**
 * @brief Loads, validates and completes the application configuration
 *
 * load() always leaves a usable configuration behind: a missing file yields
 * the defaults, and a file that fails to parse or validate is reported through
 * the returned error while the defaults stay in effect. The lookup API key is
 * resolved once at the end of every load.
 */
class ConfigManager {
public:
    // Empty path means default_config_path()
    explicit ConfigManager(const std::filesystem::path& config_path = {});
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    std::expected<void, ConfigError> load();

    const ApplicationConfig& get() const;
    const std::filesystem::path& path() const;

    // $FILMLIST_CONFIG, then $XDG_CONFIG_HOME/filmlist-resolver, then ~/.config/filmlist-resolver
    static std::filesystem::path default_config_path();

    // Fills config.api_key from the first readable Radarr config file if it is empty
    static void resolve_api_key(LookupConfig& config);

    // Value of the <ApiKey> element, if present
    static std::optional<std::string> extract_api_key(std::string_view xml);

    static std::optional<std::string> read_api_key(const std::vector<std::filesystem::path>& candidates);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace core
} // namespace filmlist_resolver
