#include "filmlist_resolver/io/result_writer.hpp"
#include "filmlist_resolver/utils/logger.hpp"

#include <fstream>

namespace filmlist_resolver {
namespace io {

ResultWriter::ResultWriter(std::filesystem::path output_dir)
    : m_output_dir(std::move(output_dir)) {
}

std::filesystem::path ResultWriter::unique_path(const std::filesystem::path& base) {
    std::error_code ec;
    if (!std::filesystem::exists(base, ec)) {
        return base;
    }

    const auto directory = base.parent_path();
    const auto stem = base.stem().string();
    const auto extension = base.extension().string();

    for (int counter = 1;; ++counter) {
        auto candidate = directory / (stem + "_" + std::to_string(counter) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

nlohmann::ordered_json ResultWriter::to_json(const std::vector<core::ResolvedMovie>& movies) {
    auto array = nlohmann::ordered_json::array();
    for (const auto& movie : movies) {
        nlohmann::ordered_json entry;
        entry["Title"] = movie.title;
        entry["Poster_url"] = movie.poster_url;
        entry["Imdb_id"] = movie.imdb_id;
        entry["Tmdb_id"] = movie.tmdb_id ? nlohmann::ordered_json(*movie.tmdb_id) : nlohmann::ordered_json(nullptr);
        array.push_back(std::move(entry));
    }
    return array;
}

std::expected<void, core::WriteError> ResultWriter::ensure_output_dir() const {
    std::error_code ec;
    std::filesystem::create_directories(m_output_dir, ec);
    if (ec || !std::filesystem::is_directory(m_output_dir, ec)) {
        FILMLIST_LOG_ERROR("ResultWriter", "Cannot create output directory " + m_output_dir.string() +
                           (ec ? ": " + ec.message() : std::string{}));
        return std::unexpected(core::WriteError::DirectoryUnavailable);
    }
    return {};
}

std::expected<std::filesystem::path, core::WriteError>
ResultWriter::write_file(std::string_view file_name, const std::string& content) const {
    if (auto dir = ensure_output_dir(); !dir) {
        return std::unexpected(dir.error());
    }

    auto path = unique_path(m_output_dir / std::filesystem::path(file_name));
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        FILMLIST_LOG_ERROR("ResultWriter", "Cannot open file for writing: " + path.string());
        return std::unexpected(core::WriteError::OpenFailed);
    }

    file << content;
    file.flush();
    if (!file) {
        FILMLIST_LOG_ERROR("ResultWriter", "Failed writing " + path.string());
        return std::unexpected(core::WriteError::WriteFailed);
    }

    FILMLIST_LOG_DEBUG("ResultWriter", "Wrote " + std::to_string(content.size()) + " bytes to " + path.string());
    return path;
}

std::expected<std::filesystem::path, core::WriteError>
ResultWriter::write_resolved_json(const std::vector<core::ResolvedMovie>& movies) {
    // Titles come from a remote service; replace invalid UTF-8 instead of throwing
    auto content = to_json(movies).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    return write_file(kResolvedFileName, content);
}

std::expected<std::filesystem::path, core::WriteError>
ResultWriter::write_lines(std::string_view file_name, const std::vector<std::string>& lines) {
    std::string content;
    for (const auto& line : lines) {
        content += line;
        content += '\n';
    }
    return write_file(file_name, content);
}

std::expected<WrittenPaths, core::WriteError> ResultWriter::write_all(const core::ResolutionResults& results) {
    WrittenPaths paths;

    auto resolved = write_resolved_json(results.resolved);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    paths.resolved = std::move(*resolved);

    auto unresolved = write_lines(kUnresolvedFileName, results.unresolved);
    if (!unresolved) {
        return std::unexpected(unresolved.error());
    }
    paths.unresolved = std::move(*unresolved);

    auto ambiguous = write_lines(kAmbiguousFileName, results.ambiguous);
    if (!ambiguous) {
        return std::unexpected(ambiguous.error());
    }
    paths.ambiguous = std::move(*ambiguous);

    return paths;
}

} // namespace io
} // namespace filmlist_resolver
