#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace filmlist_resolver {
namespace io {

struct WrittenPaths {
    std::filesystem::path resolved;
    std::filesystem::path unresolved;
    std::filesystem::path ambiguous;
};

// Writes the run results into an output directory without overwriting earlier runs
class ResultWriter {
public:
    static constexpr std::string_view kResolvedFileName = "movies_output.json";
    static constexpr std::string_view kUnresolvedFileName = "movies_not_found.txt";
    static constexpr std::string_view kAmbiguousFileName = "movies_multiple_matches.txt";

    explicit ResultWriter(std::filesystem::path output_dir);

    std::expected<WrittenPaths, core::WriteError> write_all(const core::ResolutionResults& results);

    std::expected<std::filesystem::path, core::WriteError>
    write_resolved_json(const std::vector<core::ResolvedMovie>& movies);

    // One entry per line, every line newline-terminated
    std::expected<std::filesystem::path, core::WriteError>
    write_lines(std::string_view file_name, const std::vector<std::string>& lines);

    // base itself if free, else stem_1.ext, stem_2.ext, ...
    static std::filesystem::path unique_path(const std::filesystem::path& base);

    // [{"Title", "Poster_url", "Imdb_id", "Tmdb_id"}] in that key order, Tmdb_id null when absent
    static nlohmann::ordered_json to_json(const std::vector<core::ResolvedMovie>& movies);

    const std::filesystem::path& output_dir() const { return m_output_dir; }

private:
    std::expected<void, core::WriteError> ensure_output_dir() const;
    std::expected<std::filesystem::path, core::WriteError>
    write_file(std::string_view file_name, const std::string& content) const;

    std::filesystem::path m_output_dir;
};

} // namespace io
} // namespace filmlist_resolver
