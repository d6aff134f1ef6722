#include "filmlist_resolver/services/resolution/match_selector.hpp"

#include <algorithm>

namespace filmlist_resolver {
namespace services {

MatchDecision MatchSelector::select(const std::vector<core::CandidateMatch>& candidates) {
    MatchDecision decision;
    if (candidates.empty()) {
        return decision;
    }

    decision.selected = candidates.front();
    decision.outcome = candidates.size() > 1 ? MatchOutcome::Ambiguous : MatchOutcome::Resolved;
    return decision;
}

core::ResolvedMovie MatchSelector::to_resolved_movie(const core::CandidateMatch& candidate) {
    return core::ResolvedMovie{
        .title = candidate.title,
        .poster_url = poster_url(candidate),
        .imdb_id = candidate.imdb_id,
        .tmdb_id = candidate.tmdb_id
    };
}

std::string MatchSelector::poster_url(const core::CandidateMatch& candidate) {
    auto poster = std::find_if(candidate.images.begin(), candidate.images.end(),
        [](const core::MovieImage& image) {
            return image.cover_type == "poster" && !image.remote_url.empty();
        });
    if (poster != candidate.images.end()) {
        return poster->remote_url;
    }

    return candidate.remote_poster;
}

} // namespace services
} // namespace filmlist_resolver
