#include "filmlist_resolver/services/resolution/interactive_selector.hpp"

#include <charconv>
#include <string>
#include <istream>
#include <ostream>

namespace filmlist_resolver {
namespace services {

namespace {
    std::optional<int> parse_selection(const std::string& line) {
        const auto first = line.find_first_not_of(" \t\r");
        const auto last = line.find_last_not_of(" \t\r");
        if (first == std::string::npos) {
            return std::nullopt;
        }

        int value = 0;
        const char* begin = line.data() + first;
        const char* end = line.data() + last + 1;
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr != end) {
            return std::nullopt;
        }
        return value;
    }
}

InteractiveSelector::InteractiveSelector(std::istream& input, std::ostream& output)
    : m_input(input)
    , m_output(output) {
}

std::optional<core::CandidateMatch> InteractiveSelector::choose(
    const std::vector<core::CandidateMatch>& candidates,
    const std::string& original_title) {

    if (candidates.empty()) {
        return std::nullopt;
    }

    m_output << "Multiple matches found for '" << original_title << "'. Please select one:\n";
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& movie = candidates[i];
        m_output << (i + 1) << ". " << movie.title << " ("
                 << (movie.year ? std::to_string(*movie.year) : std::string{}) << ") - "
                 << movie.imdb_id << '\n';
    }

    const int count = static_cast<int>(candidates.size());
    std::string line;
    while (true) {
        m_output << "Enter selection (1-" << count << ") or 0 to skip: " << std::flush;
        if (!std::getline(m_input, line)) {
            return std::nullopt;
        }

        if (auto selection = parse_selection(line)) {
            if (*selection == 0) {
                return std::nullopt;
            }
            if (*selection > 0 && *selection <= count) {
                return candidates[static_cast<size_t>(*selection - 1)];
            }
        }

        m_output << "Invalid selection, please try again.\n";
    }
}

} // namespace services
} // namespace filmlist_resolver
