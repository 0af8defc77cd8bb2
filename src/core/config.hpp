#pragma once

/// @file config.hpp
/// @brief Engine configuration loaded from a JSON file.

#include "core/types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <spdlog/common.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace starlight::core
{
    /// @brief Catalog source settings.
    struct CatalogConfig
    {
        std::string source = "data/hygdata_v41.csv.gz";   ///< Locator handed to the fetcher
        bool already_decompressed = false;                 ///< Transport already inflated the payload
        std::chrono::milliseconds fetch_timeout{30'000};
    };

    /// @brief External star generator settings.
    struct GeneratorConfig
    {
        std::string response_dir;                          ///< Empty = no generator configured
        std::chrono::milliseconds timeout{30'000};
    };

    /// @brief Background loading and suggestion behaviour.
    struct ServiceConfig
    {
        std::chrono::milliseconds background_load_delay{2'000};
        bool background_load = true;
        bool load_on_demand = false;                       ///< suggest() blocks on a catalog load
        i32 default_count = 5;
        std::optional<u64> seed;                           ///< Fixed RNG seed; random when absent
    };

    /// @brief Logging sinks and verbosity.
    struct LoggingConfig
    {
        std::string file = "starlight.log";
        spdlog::level::level_enum level = spdlog::level::info;
    };

    /// @brief Complete engine configuration. Every key is optional in the file.
    ///
    /// Example:
    /// @code{.json}
    /// {
    ///   "catalog":   { "source": "hyg.csv", "already_decompressed": true, "fetch_timeout_ms": 30000 },
    ///   "generator": { "response_dir": "responses", "timeout_ms": 30000 },
    ///   "service":   { "background_load_delay_ms": 2000, "default_count": 5, "seed": 42 },
    ///   "logging":   { "file": "starlight.log", "level": "debug" }
    /// }
    /// @endcode
    struct EngineConfig
    {
        CatalogConfig catalog;
        GeneratorConfig generator;
        ServiceConfig service;
        LoggingConfig logging;

        /// @brief Parse a configuration document.
        /// @return The configuration, or std::nullopt if a value has the wrong type or range.
        [[nodiscard]] static std::optional<EngineConfig> from_json(const nlohmann::json& doc);

        /// @brief Read and parse a JSON configuration file.
        /// @return The configuration, or std::nullopt if the file is missing or invalid.
        [[nodiscard]] static std::optional<EngineConfig> load_from_file(const std::filesystem::path& path);
    };

} // namespace starlight::core
