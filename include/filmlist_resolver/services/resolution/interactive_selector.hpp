#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace filmlist_resolver {
namespace services {

/**
 * @brief Manual disambiguation over a text stream pair
 *
 * Lists the candidates numbered from 1 and reads a choice. 0 or end of input
 * skips the title; anything else out of range asks again. Not used by the
 * automated run.
 */
class InteractiveSelector {
public:
    InteractiveSelector(std::istream& input, std::ostream& output);

    std::optional<core::CandidateMatch> choose(const std::vector<core::CandidateMatch>& candidates,
                                               const std::string& original_title);

private:
    std::istream& m_input;
    std::ostream& m_output;
};

} // namespace services
} // namespace filmlist_resolver
