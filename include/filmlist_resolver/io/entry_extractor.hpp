#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <expected>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>

namespace filmlist_resolver {
namespace io {

/**
 * @brief Reads the title entries out of an exported FilmAffinity list page
 *
 * Rows are the <tr> children of every <table class="ml lists">, directly or
 * through <thead>/<tbody>/<tfoot>. The text of the first <td> of a row,
 * with whitespace collapsed, is the entry. Rows without a <td> are ignored.
 * Rows whose text carries no "(yyyy)" year are logged and skipped.
 */
class EntryExtractor {
public:
    static constexpr std::string_view kListTableClass = "ml lists";

    static std::expected<std::set<core::TitleEntry>, core::ExtractError>
    extract_from_file(const std::filesystem::path& path);

    static std::expected<std::set<core::TitleEntry>, core::ExtractError>
    extract_from_html(const std::string& html);

    // "<title> (<yyyy>)" somewhere in the text
    static bool is_valid_entry(const std::string& text);
};

} // namespace io
} // namespace filmlist_resolver
