#include "test_support.hpp"

#include "filmlist_resolver/services/resolution/resolution_pipeline.hpp"
#include "filmlist_resolver/utils/logger.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace filmlist_resolver::tests {
namespace {

using namespace std::chrono_literals;
using services::ResolutionPipeline;

bool contains(const std::vector<std::string>& items, const std::string& item) {
    return std::find(items.begin(), items.end(), item) != items.end();
}

std::vector<std::string> titles_of(const std::vector<core::ResolvedMovie>& movies) {
    std::vector<std::string> titles;
    for (const auto& movie : movies) {
        titles.push_back(movie.title);
    }
    std::sort(titles.begin(), titles.end());
    return titles;
}

// Throws from write() for any message containing the trigger text
class ThrowingSink : public utils::LogSink {
public:
    explicit ThrowingSink(std::string trigger) : m_trigger(std::move(trigger)) {}

    void write(const utils::LogMessage& message) override {
        if (message.m_message.find(m_trigger) != std::string::npos) {
            throw std::runtime_error("sink failure");
        }
    }
    void flush() override {}

private:
    std::string m_trigger;
};

// Installs a process-wide logger for one test and restores the default afterwards
class ScopedLogger {
public:
    explicit ScopedLogger(std::unique_ptr<utils::LogSink> sink) {
        auto logger = std::make_unique<utils::Logger>(utils::LogLevel::Debug);
        logger->add_sink(std::move(sink));
        utils::LoggerManager::set_instance(std::move(logger));
    }
    ~ScopedLogger() { utils::LoggerManager::set_instance(nullptr); }

    ScopedLogger(const ScopedLogger&) = delete;
    ScopedLogger& operator=(const ScopedLogger&) = delete;
};

class ResolutionPipelineTest : public ::testing::Test {
protected:
    core::ResolutionResults run(const std::set<core::TitleEntry>& entries,
                                core::PipelineConfig config = {}) {
        ResolutionPipeline pipeline(m_lookup, m_translator, config, "es", "en");
        return pipeline.run(entries);
    }

    std::shared_ptr<FakeLookupClient> m_lookup = std::make_shared<FakeLookupClient>();
    std::shared_ptr<FakeTranslator> m_translator = std::make_shared<FakeTranslator>();
};

TEST_F(ResolutionPipelineTest, DirectMatchNeedsNoTranslation) {
    auto heat = make_candidate("Heat", 1995, "tt0113277", 949);
    heat.remote_poster = "https://img/heat.jpg";
    m_lookup->results["Heat (1995)"] = {heat};

    auto results = run({"Heat (1995)"});

    ASSERT_EQ(results.resolved.size(), 1u);
    EXPECT_EQ(results.resolved[0], (core::ResolvedMovie{"Heat", "https://img/heat.jpg", "tt0113277", 949}));
    EXPECT_TRUE(results.unresolved.empty());
    EXPECT_TRUE(results.ambiguous.empty());
    EXPECT_EQ(m_translator->calls(), 0);
    EXPECT_EQ(results.stats.translation_calls, 0u);
}

TEST_F(ResolutionPipelineTest, TranslatedTitleIsLookedUpWhenDirectLookupFindsNothing) {
    m_translator->translations["El secreto de sus ojos (2009)"] = "The Secret in Their Eyes (2009)";
    m_lookup->results["The Secret in Their Eyes (2009)"] = {
        make_candidate("The Secret in Their Eyes", 2009, "tt1305806")
    };

    auto results = run({"El secreto de sus ojos (2009)"});

    ASSERT_EQ(results.resolved.size(), 1u);
    EXPECT_EQ(results.resolved[0].imdb_id, "tt1305806");
    EXPECT_EQ(m_lookup->calls(), (std::vector<std::string>{
        "El secreto de sus ojos (2009)", "The Secret in Their Eyes (2009)"
    }));
    EXPECT_EQ(m_translator->calls(), 1);
    EXPECT_EQ(m_translator->last_pair(), "es->en");
    EXPECT_EQ(results.stats.translation_calls, 1u);
}

TEST_F(ResolutionPipelineTest, UnchangedTranslationSkipsSecondLookup) {
    m_translator->translations["Calor (1995)"] = "CALOR (1995)";

    auto results = run({"Calor (1995)"});

    EXPECT_TRUE(results.resolved.empty());
    EXPECT_EQ(results.unresolved, (std::vector<std::string>{"Calor (1995)"}));
    EXPECT_EQ(m_lookup->calls().size(), 1u);
    EXPECT_EQ(m_translator->calls(), 1);
}

TEST_F(ResolutionPipelineTest, NoMatchAfterTranslationIsUnresolved) {
    m_translator->translations["Nada (2001)"] = "Nothing (2001)";

    auto results = run({"Nada (2001)"});

    EXPECT_EQ(results.unresolved, (std::vector<std::string>{"Nada (2001)"}));
    EXPECT_EQ(m_lookup->calls().size(), 2u);
}

TEST_F(ResolutionPipelineTest, SeveralMatchesResolveToTopAndAreFlagged) {
    m_lookup->results["Heat (1995)"] = {
        make_candidate("Heat", 1995, "tt0113277"),
        make_candidate("Heat 2", 1995, "tt7777777")
    };

    auto results = run({"Heat (1995)"});

    ASSERT_EQ(results.resolved.size(), 1u);
    EXPECT_EQ(results.resolved[0].imdb_id, "tt0113277");
    EXPECT_EQ(results.ambiguous, (std::vector<std::string>{"Heat (1995)"}));
    EXPECT_TRUE(results.unresolved.empty());
}

TEST_F(ResolutionPipelineTest, FailingEntryDoesNotAffectOthers) {
    m_lookup->results["Heat (1995)"] = {make_candidate("Heat", 1995, "tt0113277")};
    m_lookup->results["Alien (1979)"] = {make_candidate("Alien", 1979, "tt0078748")};
    m_lookup->failing_terms.insert("Broken (2000)");

    auto results = run({"Heat (1995)", "Broken (2000)", "Alien (1979)"});

    EXPECT_EQ(titles_of(results.resolved), (std::vector<std::string>{"Alien", "Heat"}));
    EXPECT_EQ(results.unresolved, (std::vector<std::string>{"Broken (2000)"}));
    EXPECT_EQ(results.stats.failed_tasks, 1u);
}

TEST_F(ResolutionPipelineTest, FailureWhileRecordingMatchLeavesEntryUnresolvedOnly) {
    m_lookup->results["Heat (1995)"] = {
        make_candidate("Heat", 1995, "tt0113277"),
        make_candidate("Heat 2", 1995, "tt7777777")
    };
    ScopedLogger logger(std::make_unique<ThrowingSink>("Multiple matches found"));

    auto results = run({"Heat (1995)"});

    EXPECT_TRUE(results.resolved.empty());
    EXPECT_TRUE(results.ambiguous.empty());
    EXPECT_EQ(results.unresolved, (std::vector<std::string>{"Heat (1995)"}));
    EXPECT_EQ(results.stats.failed_tasks, 1u);
}

TEST_F(ResolutionPipelineTest, EveryEntryLandsInExactlyOneOutcome) {
    std::set<core::TitleEntry> entries;
    for (int i = 0; i < 30; ++i) {
        const std::string entry = "Movie " + std::to_string(i) + " (2000)";
        entries.insert(entry);
        if (i % 3 == 0) {
            m_lookup->results[entry] = {make_candidate("Movie " + std::to_string(i), 2000, "tt" + std::to_string(i))};
        } else if (i % 3 == 1) {
            m_lookup->results[entry] = {
                make_candidate("Movie " + std::to_string(i), 2000, "tt" + std::to_string(i)),
                make_candidate("Other", 2000, "tt9" + std::to_string(i))
            };
        }
    }

    auto results = run(entries);

    EXPECT_EQ(results.resolved.size(), 20u);
    EXPECT_EQ(results.unresolved.size(), 10u);
    EXPECT_EQ(results.ambiguous.size(), 10u);
    EXPECT_EQ(results.stats.total, 30u);
    EXPECT_EQ(results.stats.resolved + results.stats.unresolved, results.stats.total);

    for (const auto& entry : results.ambiguous) {
        EXPECT_FALSE(contains(results.unresolved, entry));
    }
}

TEST_F(ResolutionPipelineTest, NeverExceedsFiveEntriesInFlight) {
    m_lookup->latency = 20ms;
    std::set<core::TitleEntry> entries;
    for (int i = 0; i < 25; ++i) {
        entries.insert("Title " + std::to_string(i) + " (1990)");
    }

    core::PipelineConfig config;
    config.worker_threads = 16;
    auto results = run(entries, config);

    EXPECT_EQ(results.unresolved.size(), 25u);
    EXPECT_LE(m_lookup->max_concurrent_calls(), 5);
    EXPECT_GE(m_lookup->max_concurrent_calls(), 1);
    EXPECT_LE(results.stats.peak_in_flight, 5u);
    EXPECT_GE(results.stats.peak_in_flight, 1u);
}

TEST_F(ResolutionPipelineTest, HonoursSmallerConcurrencyLimit) {
    m_lookup->latency = 10ms;
    std::set<core::TitleEntry> entries;
    for (int i = 0; i < 12; ++i) {
        entries.insert("Title " + std::to_string(i) + " (1990)");
    }

    core::PipelineConfig config;
    config.max_concurrency = 2;
    config.worker_threads = 8;
    auto results = run(entries, config);

    EXPECT_EQ(results.stats.total, 12u);
    EXPECT_LE(m_lookup->max_concurrent_calls(), 2);
    EXPECT_LE(results.stats.peak_in_flight, 2u);
}

TEST_F(ResolutionPipelineTest, EmptyInputProducesEmptyResults) {
    auto results = run({});

    EXPECT_TRUE(results.resolved.empty());
    EXPECT_TRUE(results.unresolved.empty());
    EXPECT_TRUE(results.ambiguous.empty());
    EXPECT_EQ(results.stats.total, 0u);
    EXPECT_TRUE(m_lookup->calls().empty());
}

TEST_F(ResolutionPipelineTest, ResolveEntryReportsWhetherTranslationRan) {
    m_lookup->results["Heat (1995)"] = {make_candidate("Heat", 1995, "tt0113277")};
    ResolutionPipeline pipeline(m_lookup, m_translator, {}, "es", "en");

    bool translated = true;
    auto direct = pipeline.resolve_entry("Heat (1995)", translated);
    EXPECT_TRUE(direct.is_resolved());
    EXPECT_FALSE(translated);

    auto missing = pipeline.resolve_entry("Calor (1995)", translated);
    EXPECT_FALSE(missing.is_resolved());
    EXPECT_TRUE(translated);
}

} // namespace
} // namespace filmlist_resolver::tests
