#include "filmlist_resolver/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace filmlist_resolver::utils {

namespace {
    bool is_space(unsigned char c) {
        return std::isspace(c) != 0;
    }
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
        [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::string trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && is_space(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string collapse_whitespace(std::string_view text) {
    // U+00A0 as UTF-8
    constexpr std::string_view NBSP = "\xC2\xA0";

    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (size_t i = 0; i < text.size(); ++i) {
        bool space = is_space(static_cast<unsigned char>(text[i]));
        if (!space && text.substr(i, NBSP.size()) == NBSP) {
            space = true;
            ++i;
        }

        if (space) {
            if (!in_space) {
                out.push_back(' ');
                in_space = true;
            }
        } else {
            out.push_back(text[i]);
            in_space = false;
        }
    }
    return trim(out);
}

} // namespace filmlist_resolver::utils
