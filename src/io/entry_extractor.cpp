#include "filmlist_resolver/io/entry_extractor.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"

#include <gumbo.h>

#include <fstream>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <vector>

namespace filmlist_resolver {
namespace io {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

bool is_element(const GumboNode* node, GumboTag tag) {
    return node && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

template<typename Func>
void for_each_child(const GumboNode* node, Func&& func) {
    if (!node || node->type != GUMBO_NODE_ELEMENT) {
        return;
    }
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        func(static_cast<const GumboNode*>(children->data[i]));
    }
}

void append_text(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            out += node->v.text.text;
            break;
        case GUMBO_NODE_ELEMENT:
            for_each_child(node, [&out](const GumboNode* child) { append_text(child, out); });
            break;
        default:
            break;
    }
}

bool is_list_table(const GumboNode* node) {
    if (!is_element(node, GUMBO_TAG_TABLE)) {
        return false;
    }
    const GumboAttribute* cls = gumbo_get_attribute(&node->v.element.attributes, "class");
    return cls && utils::collapse_whitespace(cls->value) == EntryExtractor::kListTableClass;
}

void collect_list_tables(const GumboNode* node, std::vector<const GumboNode*>& tables) {
    if (is_list_table(node)) {
        tables.push_back(node);
    }
    for_each_child(node, [&tables](const GumboNode* child) { collect_list_tables(child, tables); });
}

void collect_rows(const GumboNode* table, std::vector<const GumboNode*>& rows) {
    for_each_child(table, [&rows](const GumboNode* child) {
        if (is_element(child, GUMBO_TAG_TR)) {
            rows.push_back(child);
        } else if (is_element(child, GUMBO_TAG_TBODY) ||
                   is_element(child, GUMBO_TAG_THEAD) ||
                   is_element(child, GUMBO_TAG_TFOOT)) {
            for_each_child(child, [&rows](const GumboNode* row) {
                if (is_element(row, GUMBO_TAG_TR)) {
                    rows.push_back(row);
                }
            });
        }
    });
}

std::optional<std::string> first_cell_text(const GumboNode* row) {
    std::optional<std::string> text;
    for_each_child(row, [&text](const GumboNode* cell) {
        if (!text && is_element(cell, GUMBO_TAG_TD)) {
            std::string raw;
            append_text(cell, raw);
            text = utils::collapse_whitespace(raw);
        }
    });
    return text;
}

} // namespace

bool EntryExtractor::is_valid_entry(const std::string& text) {
    static const std::regex entry_pattern(R"((.*?)\s*\((\d{4})\))");
    return std::regex_search(text, entry_pattern);
}

std::expected<std::set<core::TitleEntry>, core::ExtractError>
EntryExtractor::extract_from_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        FILMLIST_LOG_ERROR("EntryExtractor", "HTML file not found at: " + path.string());
        return std::unexpected(core::ExtractError::FileNotFound);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        FILMLIST_LOG_ERROR("EntryExtractor", "Cannot open HTML file: " + path.string());
        return std::unexpected(core::ExtractError::ReadFailed);
    }

    std::stringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        FILMLIST_LOG_ERROR("EntryExtractor", "Error reading HTML file: " + path.string());
        return std::unexpected(core::ExtractError::ReadFailed);
    }

    FILMLIST_LOG_DEBUG("EntryExtractor", "Read " + std::to_string(content.str().size()) + " bytes from " + path.string());
    return extract_from_html(content.str());
}

std::expected<std::set<core::TitleEntry>, core::ExtractError>
EntryExtractor::extract_from_html(const std::string& html) {
    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output) {
        FILMLIST_LOG_ERROR("EntryExtractor", "HTML parser returned no document");
        return std::unexpected(core::ExtractError::ReadFailed);
    }

    std::vector<const GumboNode*> tables;
    collect_list_tables(output->root, tables);
    if (tables.empty()) {
        FILMLIST_LOG_ERROR("EntryExtractor", "No movie list table found in the HTML file");
        return std::unexpected(core::ExtractError::NoTableFound);
    }

    std::vector<const GumboNode*> rows;
    for (const auto* table : tables) {
        collect_rows(table, rows);
    }

    std::set<core::TitleEntry> entries;
    for (const auto* row : rows) {
        auto text = first_cell_text(row);
        if (!text) {
            continue;
        }

        if (is_valid_entry(*text)) {
            entries.insert(std::move(*text));
        } else {
            FILMLIST_LOG_WARNING("EntryExtractor", "Invalid format for movie: " + *text);
        }
    }

    if (entries.empty()) {
        FILMLIST_LOG_ERROR("EntryExtractor", "No movie rows found in the list table");
        return std::unexpected(core::ExtractError::NoEntriesFound);
    }

    FILMLIST_LOG_INFO("EntryExtractor", "Found " + std::to_string(entries.size()) + " movies in the list");
    return entries;
}

} // namespace io
} // namespace filmlist_resolver
