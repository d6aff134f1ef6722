#pragma once

#include "filmlist_resolver/core/models.hpp"
#include <optional>
#include <string>
#include <vector>

namespace filmlist_resolver {
namespace services {

enum class MatchOutcome {
    Unresolved,
    Resolved,
    Ambiguous   // Resolved to the top candidate, flagged for review
};

struct MatchDecision {
    MatchOutcome outcome = MatchOutcome::Unresolved;
    std::optional<core::CandidateMatch> selected;

    bool is_resolved() const { return selected.has_value(); }
    bool is_ambiguous() const { return outcome == MatchOutcome::Ambiguous; }
};

class MatchSelector {
public:
    // Candidates must already be ranked, best first
    static MatchDecision select(const std::vector<core::CandidateMatch>& candidates);

    static core::ResolvedMovie to_resolved_movie(const core::CandidateMatch& candidate);
    static std::string poster_url(const core::CandidateMatch& candidate);
};

} // namespace services
} // namespace filmlist_resolver
