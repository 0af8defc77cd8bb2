/// @file test_logger.cpp
/// @brief Unit tests for starlight::core::Logger lifetime.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "core/timeout.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace starlight;
using namespace std::chrono_literals;

int main(int argc, char** argv)
{
    starlight::core::Logger::init("starlight_tests.log");
    const int result = doctest::Context(argc, argv).run();
    starlight::core::Logger::shutdown();
    return result;
}

TEST_CASE("Loggers remain usable after shutdown")
{
    core::Logger::shutdown();

    REQUIRE(core::Logger::get_core_logger() != nullptr);
    REQUIRE(core::Logger::get_app_logger() != nullptr);
    CHECK_NOTHROW(SLT_CORE_WARN("core message after shutdown"));
    CHECK_NOTHROW(SLT_WARN("app message after shutdown"));

    core::Logger::init("starlight_tests.log");
}

TEST_CASE("Abandoned worker may log after shutdown")
{
    auto logged = std::make_shared<std::atomic<bool>>(false);

    const auto result = core::call_with_timeout(
        [logged]()
        {
            std::this_thread::sleep_for(100ms);
            SLT_CORE_WARN("late worker finished");
            logged->store(true);
            return 1;
        },
        10ms);
    CHECK_FALSE(result.has_value());

    core::Logger::shutdown();

    for (int i = 0; i < 100 && !logged->load(); ++i)
    {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(logged->load());

    core::Logger::init("starlight_tests.log");
}

TEST_CASE("Re-initialising replaces the registered loggers")
{
    core::Logger::init("starlight_tests.log", spdlog::level::warn);

    CHECK(spdlog::get("STARLIGHT") == core::Logger::get_core_logger());
    CHECK(spdlog::get("APP") == core::Logger::get_app_logger());
    CHECK(core::Logger::get_core_logger()->level() == spdlog::level::warn);

    core::Logger::init("starlight_tests.log");
}
