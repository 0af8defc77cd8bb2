// src/main.cpp - Starlight suggestion engine demo
//
// Demonstrates the engine end to end:
//  1. Read configuration (optional JSON path as first argument)
//  2. Start the catalog service and schedule the background load
//  3. Load the catalog in the foreground (joins the background attempt)
//  4. Resolve suggestions for every emotion category
//  5. Print the projected suggestions as JSON

#include "catalog/catalog_fetcher.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "service/catalog_service.hpp"
#include "service/projection.hpp"
#include "suggestion/emotion.hpp"
#include "suggestion/star_generator.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <utility>

using namespace starlight;

int main(int argc, char** argv) {
    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    core::Logger::init();

    core::EngineConfig config;
    if (argc > 1) {
        auto loaded = core::EngineConfig::load_from_file(argv[1]);
        if (!loaded) {
            SLT_CRITICAL("Invalid configuration file: {}", argv[1]);
            core::Logger::shutdown();
            return 1;
        }
        config = std::move(*loaded);
    }

    core::Logger::init(config.logging.file, config.logging.level);
    SLT_INFO("Starlight starting, catalog source: {}", config.catalog.source);

    // -----------------------------------------------------------------------
    // 2. Service
    // -----------------------------------------------------------------------
    std::shared_ptr<suggestion::StarGenerator> generator;
    if (!config.generator.response_dir.empty()) {
        generator = std::make_shared<suggestion::JsonFileStarGenerator>(config.generator.response_dir);
    }

    int exit_code = 0;
    {
        service::CatalogService service(config,
                                        std::make_shared<catalog::FileCatalogFetcher>(),
                                        generator);
        service.start();

        // -------------------------------------------------------------------
        // 3. Foreground load
        // -------------------------------------------------------------------
        const auto loaded = service.load_catalog();
        if (loaded.ok()) {
            SLT_INFO("Catalog ready: {} stars ({} malformed rows skipped)",
                     loaded.index->total_count(), loaded.malformed_rows);
        } else {
            SLT_WARN("Catalog unavailable ({}), suggestions will be synthetic",
                     catalog::to_string(*loaded.error));
            exit_code = 2;
        }

        // -------------------------------------------------------------------
        // 4-5. Suggestions per emotion
        // -------------------------------------------------------------------
        nlohmann::json output = nlohmann::json::object();
        for (const auto& category : suggestion::emotion_categories()) {
            const std::string key(category.key);
            output[key] = service::project_suggestions(service.suggest(key));
        }
        std::cout << output.dump(2) << "\n";
    }

    SLT_INFO("Starlight shutting down");
    core::Logger::shutdown();
    return exit_code;
}
