#pragma once

#include <string>
#include <string_view>

namespace filmlist_resolver::utils {

// ASCII case-insensitive equality
bool equals_ignore_case(std::string_view a, std::string_view b);

std::string trim(std::string_view text);

// Trims and folds every whitespace run (including &nbsp;) into one space
std::string collapse_whitespace(std::string_view text);

} // namespace filmlist_resolver::utils
