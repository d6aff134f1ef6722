#include "filmlist_resolver/services/resolution/resolution_pipeline.hpp"
#include "filmlist_resolver/services/lookup/lookup_client.hpp"
#include "filmlist_resolver/services/translation/translator.hpp"
#include "filmlist_resolver/utils/concurrent_bag.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "filmlist_resolver/utils/string_utils.hpp"
#include "filmlist_resolver/utils/threading.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <vector>

namespace filmlist_resolver {
namespace services {

struct ResolutionPipeline::RunState {
    explicit RunState(size_t capacity) : gate(capacity) {}

    utils::AdmissionGate gate;
    utils::ConcurrentBag<core::ResolvedMovie> resolved;
    utils::ConcurrentBag<core::TitleEntry> unresolved;
    utils::ConcurrentBag<core::TitleEntry> ambiguous;
    std::atomic<size_t> translation_calls{0};
    std::atomic<size_t> failed_tasks{0};
};

ResolutionPipeline::ResolutionPipeline(std::shared_ptr<ILookupClient> lookup_client,
                                       std::shared_ptr<ITranslator> translator,
                                       core::PipelineConfig config,
                                       std::string source_language,
                                       std::string target_language)
    : m_lookup_client(std::move(lookup_client))
    , m_translator(std::move(translator))
    , m_config(std::move(config))
    , m_source_language(std::move(source_language))
    , m_target_language(std::move(target_language)) {
}

MatchDecision ResolutionPipeline::resolve_entry(const core::TitleEntry& entry, bool& translated) {
    translated = false;
    auto candidates = m_lookup_client->lookup(entry);

    if (candidates.empty()) {
        translated = true;
        auto translated_title = m_translator->translate(entry, m_source_language, m_target_language);

        if (!utils::equals_ignore_case(translated_title, entry)) {
            FILMLIST_LOG_DEBUG("Pipeline", "Retrying lookup with translated title: " + translated_title);
            candidates = m_lookup_client->lookup(translated_title);
        } else {
            FILMLIST_LOG_DEBUG("Pipeline", "Translation unchanged for: " + entry);
        }
    }

    return MatchSelector::select(candidates);
}

void ResolutionPipeline::process_entry(const core::TitleEntry& entry, RunState& state) {
    auto slot = state.gate.acquire();

    try {
        FILMLIST_LOG_INFO("Pipeline", "Processing: " + entry);

        bool translated = false;
        auto decision = resolve_entry(entry, translated);
        if (translated) {
            state.translation_calls.fetch_add(1);
        }

        if (!decision.is_resolved()) {
            FILMLIST_LOG_INFO("Pipeline", "No match found for: " + entry);
            state.unresolved.append(entry);
            return;
        }

        auto movie = MatchSelector::to_resolved_movie(*decision.selected);
        FILMLIST_LOG_INFO("Pipeline", "Matched '" + entry + "' -> " + movie.title + " (" + movie.imdb_id + ")");

        const bool ambiguous = decision.is_ambiguous();
        if (ambiguous) {
            FILMLIST_LOG_INFO("Pipeline", "Multiple matches found for: " + entry);
        }

        // Recording comes last: a throw above must leave the entry in unresolved only
        if (ambiguous) {
            state.ambiguous.append(entry);
        }
        state.resolved.append(std::move(movie));
    } catch (const std::exception& e) {
        FILMLIST_LOG_ERROR("Pipeline", "Error processing '" + entry + "': " + e.what());
        state.failed_tasks.fetch_add(1);
        state.unresolved.append(entry);
    } catch (...) {
        FILMLIST_LOG_ERROR("Pipeline", "Unknown error processing '" + entry + "'");
        state.failed_tasks.fetch_add(1);
        state.unresolved.append(entry);
    }
}

core::ResolutionResults ResolutionPipeline::run(const std::set<core::TitleEntry>& entries) {
    const auto started = std::chrono::steady_clock::now();
    core::ResolutionResults results;
    results.stats.total = entries.size();

    if (entries.empty()) {
        return results;
    }

    const size_t capacity = std::max<size_t>(1, m_config.max_concurrency);
    const size_t workers = std::clamp<size_t>(m_config.worker_threads, 1, entries.size());

    FILMLIST_LOG_INFO("Pipeline", "Resolving " + std::to_string(entries.size()) + " entries with " +
                      std::to_string(workers) + " workers, at most " + std::to_string(capacity) + " in flight");

    RunState state(capacity);
    {
        utils::ThreadPool pool(workers);
        std::vector<std::future<void>> pending;
        pending.reserve(entries.size());

        for (const auto& entry : entries) {
            auto submitted = pool.try_submit([this, &state, entry]() { process_entry(entry, state); });
            if (!submitted) {
                FILMLIST_LOG_ERROR("Pipeline", "Could not schedule entry: " + entry);
                state.failed_tasks.fetch_add(1);
                state.unresolved.append(entry);
                continue;
            }
            pending.push_back(std::move(*submitted));
        }

        for (auto& task : pending) {
            task.get();
        }
        pool.shutdown();
    }

    results.resolved = state.resolved.drain();
    results.unresolved = state.unresolved.drain();
    results.ambiguous = state.ambiguous.drain();

    auto& stats = results.stats;
    stats.resolved = results.resolved.size();
    stats.unresolved = results.unresolved.size();
    stats.ambiguous = results.ambiguous.size();
    stats.translation_calls = state.translation_calls.load();
    stats.failed_tasks = state.failed_tasks.load();
    stats.peak_in_flight = state.gate.peak_in_flight();
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    FILMLIST_LOG_DEBUG("Pipeline", "Translation calls: " + std::to_string(stats.translation_calls) +
                       ", peak in flight: " + std::to_string(stats.peak_in_flight) +
                       ", elapsed: " + std::to_string(stats.elapsed.count()) + "ms");
    return results;
}

} // namespace services
} // namespace filmlist_resolver
