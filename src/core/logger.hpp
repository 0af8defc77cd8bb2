#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace starlight::core
{
    /// @brief Centralized logging facility for Starlight.
    ///
    /// Provides two separate loggers:
    /// - **STARLIGHT** (core): catalog loading, indexing, suggestion pipeline
    /// - **APP**: demo executable and service-level messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any SLT_ macros are used.
        /// @param log_file Path of the rotating log file.
        /// @param level Minimum level for both loggers.
        static void init(const std::string& log_file = "starlight.log",
                         spdlog::level::level_enum level = spdlog::level::trace);

        /// @brief Flush both loggers and drop them from the spdlog registry.
        /// The loggers themselves remain usable so detached workers can still log.
        static void shutdown();

        /// @brief Access the engine-internal logger ("STARLIGHT").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace starlight::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SLT_CORE_TRACE(...)    ::starlight::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SLT_CORE_DEBUG(...)    ::starlight::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SLT_CORE_INFO(...)     ::starlight::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SLT_CORE_WARN(...)     ::starlight::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SLT_CORE_ERROR(...)    ::starlight::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SLT_CORE_CRITICAL(...) ::starlight::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SLT_TRACE(...)         ::starlight::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SLT_INFO(...)          ::starlight::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SLT_WARN(...)          ::starlight::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SLT_ERROR(...)         ::starlight::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SLT_CRITICAL(...)      ::starlight::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
