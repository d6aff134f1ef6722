#pragma once

#include "filmlist_resolver/utils/logger.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace filmlist_resolver {
namespace core {

// ============================================================================
// Error types
// ============================================================================

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

enum class LookupError {
    NetworkError,
    HttpError,
    ParseError,
    InvalidResponse
};

enum class TranslationError {
    NetworkError,
    HttpError,
    ParseError
};

enum class ExtractError {
    FileNotFound,
    ReadFailed,
    NoTableFound,
    NoEntriesFound
};

enum class WriteError {
    DirectoryUnavailable,
    OpenFailed,
    WriteFailed
};

std::string to_string(ConfigError error);
std::string to_string(LookupError error);
std::string to_string(TranslationError error);
std::string to_string(ExtractError error);
std::string to_string(WriteError error);

// ============================================================================
// Domain types
// ============================================================================

// "<title> (<year>)" as it appears in the exported list
using TitleEntry = std::string;

struct MovieImage {
    std::string cover_type;          // "poster", "fanart", ...
    std::string url;
    std::string remote_url;
};

// One lookup search result
struct CandidateMatch {
    std::string title;
    std::string original_title;
    std::optional<int> year;
    std::optional<int> secondary_year;
    std::string overview;
    std::vector<std::string> genres;

    // External IDs
    std::string imdb_id;             // Primary identifier, may be empty
    std::optional<int> tmdb_id;      // Secondary identifier

    std::optional<double> popularity;
    std::string remote_poster;
    std::vector<MovieImage> images;

    bool has_identifier() const { return !imdb_id.empty() || tmdb_id.has_value(); }
};

// Output projection of a chosen candidate
struct ResolvedMovie {
    std::string title;
    std::string poster_url;
    std::string imdb_id;
    std::optional<int> tmdb_id;

    bool operator==(const ResolvedMovie&) const = default;
};

struct ResolutionStats {
    std::size_t total = 0;
    std::size_t resolved = 0;
    std::size_t unresolved = 0;
    std::size_t ambiguous = 0;
    std::size_t translation_calls = 0;
    std::size_t failed_tasks = 0;
    std::size_t peak_in_flight = 0;
    std::chrono::milliseconds elapsed{0};
};

struct ResolutionResults {
    std::vector<ResolvedMovie> resolved;
    std::vector<TitleEntry> unresolved;
    std::vector<TitleEntry> ambiguous;
    ResolutionStats stats;
};

// ============================================================================
// Configuration structures
// ============================================================================

struct LookupConfig {
    std::string base_url = "http://radarr:7878/api/v3/movie";
    std::string api_key;
    std::vector<std::filesystem::path> radarr_config_paths = {
        "/data/radarr/config/config.xml",
        "../data/radarr/config/config.xml"
    };
    std::chrono::seconds timeout{30};
};

struct TranslationConfig {
    std::string base_url = "http://libretranslate:5000";
    std::string source_language = "es";
    std::string target_language = "en";
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::seconds timeout{30};
};

struct PipelineConfig {
    std::size_t max_concurrency = 5;
    std::size_t worker_threads = 8;
};

struct IoConfig {
    std::filesystem::path input_dir = "/input";
    std::filesystem::path output_dir = "/output";
    std::string default_input = "filmaffinity_list.html";
};

struct ApplicationConfig {
    filmlist_resolver::utils::LogLevel log_level = filmlist_resolver::utils::LogLevel::Info;
    std::filesystem::path log_file;

    LookupConfig lookup;
    TranslationConfig translation;
    PipelineConfig pipeline;
    IoConfig io;
};

} // namespace core
} // namespace filmlist_resolver
