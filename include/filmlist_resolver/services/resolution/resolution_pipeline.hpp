#pragma once

#include "filmlist_resolver/core/models.hpp"
#include "filmlist_resolver/services/resolution/match_selector.hpp"
#include <memory>
#include <set>
#include <string>

namespace filmlist_resolver {
namespace services {

class ILookupClient;
class ITranslator;

/**
 * @brief Resolves a set of title entries against the lookup service
 *
 * Every entry runs as its own task on a worker pool. An admission gate caps
 * the number of tasks past their first lookup at max_concurrency. Per entry:
 *
 *   Lookup(entry) -- empty --> Translate(entry) -- differs --> Lookup(translated)
 *        |                           | same (ignoring case)          |
 *        v                           v                               v
 *      Select <--------------------------------------------------------
 *
 * Select records the entry as resolved (top candidate) or unresolved, and
 * additionally as ambiguous when more than one candidate survived filtering.
 * A task that throws is logged and counted as unresolved; it never stops
 * the other tasks. run() returns once every task has finished.
 */
class ResolutionPipeline {
public:
    ResolutionPipeline(std::shared_ptr<ILookupClient> lookup_client,
                       std::shared_ptr<ITranslator> translator,
                       core::PipelineConfig config,
                       std::string source_language = "es",
                       std::string target_language = "en");

    core::ResolutionResults run(const std::set<core::TitleEntry>& entries);

    // The state machine for one entry, without the gate or failure isolation
    MatchDecision resolve_entry(const core::TitleEntry& entry, bool& translated);

private:
    struct RunState;

    void process_entry(const core::TitleEntry& entry, RunState& state);

    std::shared_ptr<ILookupClient> m_lookup_client;
    std::shared_ptr<ITranslator> m_translator;
    core::PipelineConfig m_config;
    std::string m_source_language;
    std::string m_target_language;
};

} // namespace services
} // namespace filmlist_resolver
