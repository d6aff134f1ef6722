#include "filmlist_resolver/core/config_manager.hpp"
#include "filmlist_resolver/io/entry_extractor.hpp"
#include "filmlist_resolver/io/result_writer.hpp"
#include "filmlist_resolver/services/lookup/lookup_client.hpp"
#include "filmlist_resolver/services/network/http_client.hpp"
#include "filmlist_resolver/services/resolution/resolution_pipeline.hpp"
#include "filmlist_resolver/services/translation/translator.hpp"
#include "filmlist_resolver/utils/logger.hpp"
#include "version.h"

#include <cstdlib>
#include <memory>
#include <string>

namespace {
    std::unique_ptr<filmlist_resolver::utils::Logger> setup_logging(
        const filmlist_resolver::core::ApplicationConfig& config) {
        using namespace filmlist_resolver::utils;

        auto logger = std::make_unique<Logger>(config.log_level);
        logger->add_sink(std::make_unique<ConsoleSink>(true));

        if (!config.log_file.empty()) {
            auto file_sink = std::make_unique<FileSink>(config.log_file, false);
            if (file_sink->is_open()) {
                logger->add_sink(std::move(file_sink));
            } else {
                logger->warning("Main", "Cannot open log file: " + config.log_file.string());
            }
        }

        return logger;
    }

    void log_working_path() {
        const char* input_path = std::getenv("INPUT_PATH");
        FILMLIST_LOG_INFO("Main", "Working path: " + std::string(input_path ? input_path : "(INPUT_PATH not set)"));
    }

    void run(const filmlist_resolver::core::ApplicationConfig& config, int argc, char* argv[]) {
        using namespace filmlist_resolver;

        const std::string file_name = argc > 1 ? argv[1] : config.io.default_input;
        const auto input_path = config.io.input_dir / file_name;

        auto entries = io::EntryExtractor::extract_from_file(input_path);
        if (!entries) {
            FILMLIST_LOG_ERROR("Main", "Stopping: " + core::to_string(entries.error()) + " (" + input_path.string() + ")");
            return;
        }

        services::HttpClientConfig http_config;
        http_config.user_agent = "filmlist-resolver/" FILMLIST_VERSION_STRING;
        std::shared_ptr<services::HttpClient> http_client = services::create_http_client(http_config);

        auto lookup_client = std::make_shared<services::RadarrLookupClient>(http_client, config.lookup);
        auto translator = std::make_shared<services::LibreTranslateClient>(http_client, config.translation);

        services::ResolutionPipeline pipeline(lookup_client, translator, config.pipeline,
                                              config.translation.source_language,
                                              config.translation.target_language);
        auto results = pipeline.run(*entries);

        io::ResultWriter writer(config.io.output_dir);
        auto written = writer.write_all(results);
        if (!written) {
            FILMLIST_LOG_ERROR("Main", "Could not write results: " + core::to_string(written.error()));
            return;
        }

        FILMLIST_LOG_INFO("Main", "Processing complete. Saved " + std::to_string(results.resolved.size()) +
                          " movies to " + written->resolved.string());
        FILMLIST_LOG_INFO("Main", "Saved " + std::to_string(results.unresolved.size()) +
                          " not found entries to " + written->unresolved.string());
        FILMLIST_LOG_INFO("Main", "Saved " + std::to_string(results.ambiguous.size()) +
                          " multiple match entries to " + written->ambiguous.string());

        const auto& stats = results.stats;
        FILMLIST_LOG_INFO("Main", "Translation calls: " + std::to_string(stats.translation_calls) +
                          ", failed tasks: " + std::to_string(stats.failed_tasks) +
                          ", peak in flight: " + std::to_string(stats.peak_in_flight) +
                          ", elapsed: " + std::to_string(stats.elapsed.count()) + "ms");
    }
} // anonymous namespace

// Exits 0 on every path; failures are reported through the log
int main(int argc, char* argv[]) {
    using namespace filmlist_resolver;

    try {
        core::ConfigManager config_service;
        const auto loaded = config_service.load();

        const auto& config = config_service.get();
        utils::LoggerManager::set_instance(setup_logging(config));
        if (!loaded) {
            FILMLIST_LOG_WARNING("Main", "Using default configuration (" + core::to_string(loaded.error()) + ")");
        }

        FILMLIST_LOG_INFO("Main", "filmlist-resolver v" FILMLIST_VERSION_STRING " starting");
        FILMLIST_LOG_DEBUG("Main", "Log level: " + utils::to_string(config.log_level));
        log_working_path();

        run(config, argc, argv);
    } catch (const std::exception& e) {
        FILMLIST_LOG_ERROR("Main", "Fatal: " + std::string(e.what()));
    }

    utils::LoggerManager::get_instance().flush();
    return 0;
}
