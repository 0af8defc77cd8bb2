/// @file test_catalog_service.cpp
/// @brief Unit tests for starlight::service::CatalogService scheduling and suggestions.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "service/catalog_service.hpp"
#include "test_support.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace starlight;
using namespace starlight::service;
using namespace std::chrono_literals;

int main(int argc, char** argv)
{
    starlight::core::Logger::init("starlight_tests.log");
    const int result = doctest::Context(argc, argv).run();
    starlight::core::Logger::shutdown();
    return result;
}

namespace
{

core::EngineConfig test_config(std::chrono::milliseconds delay)
{
    core::EngineConfig config;
    config.catalog.source = "memory://hyg";
    config.catalog.already_decompressed = true;
    config.catalog.fetch_timeout = 2s;
    config.generator.timeout = 1s;
    config.service.background_load_delay = delay;
    config.service.seed = 42;
    return config;
}

} // namespace

// =================================================================
// Background scheduling
// =================================================================

TEST_CASE("Background load runs once after the delay")
{
    auto fetcher = std::make_shared<test::ScriptedFetcher>(test::make_named_catalog_csv(40));
    CatalogService service(test_config(20ms), fetcher, nullptr);

    CHECK(service.start());
    CHECK_FALSE(service.start());

    service.wait_for_background();

    CHECK(service.loader().state() == catalog::LoadState::Loaded);
    CHECK(fetcher->calls() == 1);
}

TEST_CASE("Failed background load is not retried")
{
    auto fetcher = std::make_shared<test::ScriptedFetcher>(std::nullopt);
    CatalogService service(test_config(10ms), fetcher, nullptr);

    REQUIRE(service.start());
    service.wait_for_background();

    CHECK(service.loader().state() == catalog::LoadState::Failed);
    CHECK_FALSE(service.start());

    const auto result = service.load_catalog();
    REQUIRE(result.error.has_value());
    CHECK(*result.error == catalog::CatalogError::PreviouslyFailed);
    CHECK(fetcher->calls() == 1);
}

TEST_CASE("Background load is skipped when a foreground load already ran")
{
    auto fetcher = std::make_shared<test::ScriptedFetcher>(test::make_named_catalog_csv(40));
    CatalogService service(test_config(100ms), fetcher, nullptr);

    REQUIRE(service.start());
    REQUIRE(service.load_catalog().ok());

    service.wait_for_background();
    CHECK(fetcher->calls() == 1);
}

TEST_CASE("Destroying the service cancels a pending background load")
{
    auto fetcher = std::make_shared<test::ScriptedFetcher>(test::make_named_catalog_csv(40));

    const auto started = std::chrono::steady_clock::now();
    {
        CatalogService service(test_config(10s), fetcher, nullptr);
        REQUIRE(service.start());
    }
    const auto elapsed = std::chrono::steady_clock::now() - started;

    CHECK(elapsed < 2s);
    CHECK(fetcher->calls() == 0);
}

TEST_CASE("Disabled background load schedules nothing")
{
    auto config = test_config(10ms);
    config.service.background_load = false;
    CatalogService service(config, std::make_shared<test::ScriptedFetcher>(std::nullopt), nullptr);

    CHECK_FALSE(service.start());
    CHECK(service.loader().state() == catalog::LoadState::Unloaded);
}

// =================================================================
// Suggestions
// =================================================================

TEST_CASE("Suggestions before the catalog loads come from the fallback stage")
{
    CatalogService service(test_config(10s), std::make_shared<test::ScriptedFetcher>(std::nullopt), nullptr);

    const auto suggestions = service.suggest("family");

    REQUIRE(suggestions.size() == 5);
    CHECK(suggestions[0].source == suggestion::SuggestionSource::Fallback);
}

TEST_CASE("Suggestions after loading come from the catalog")
{
    CatalogService service(test_config(10s),
                           std::make_shared<test::ScriptedFetcher>(test::make_named_catalog_csv(40)), nullptr);

    REQUIRE(service.load_catalog().ok());
    const auto suggestions = service.suggest("family", 4);

    REQUIRE(suggestions.size() == 4);
    CHECK(suggestions[0].id == "catalog-1002");
}

TEST_CASE("Load on demand makes the first suggestion wait for the catalog")
{
    auto config = test_config(10s);
    config.service.load_on_demand = true;
    auto fetcher = std::make_shared<test::ScriptedFetcher>(test::make_named_catalog_csv(40));
    CatalogService service(config, fetcher, nullptr);

    const auto suggestions = service.suggest("love");

    REQUIRE(suggestions.size() == 5);
    CHECK(suggestions[0].source == suggestion::SuggestionSource::Catalog);
    CHECK(fetcher->calls() == 1);
}

TEST_CASE("AI generator is used once the catalog is available")
{
    auto generator = std::make_shared<test::ScriptedGenerator>(test::proposals({"Vega", "Deneb"}));
    CatalogService service(test_config(10s),
                           std::make_shared<test::ScriptedFetcher>(std::string(test::kSummerTriangleCsv)),
                           generator);

    REQUIRE(service.load_catalog().ok());
    const auto suggestions = service.suggest("love", 2);

    REQUIRE(suggestions.size() == 2);
    CHECK(suggestions[0].id == "ai-91262");
    CHECK(suggestions[1].id == "ai-102098");
}

TEST_CASE("Reset after a failed load allows loading again")
{
    auto fetcher = std::make_shared<test::ScriptedFetcher>(std::nullopt);
    CatalogService service(test_config(10s), fetcher, nullptr);

    CHECK_FALSE(service.load_catalog().ok());
    CHECK(service.reset_catalog());
    CHECK_FALSE(service.load_catalog().ok());
    CHECK(fetcher->calls() == 2);
}
