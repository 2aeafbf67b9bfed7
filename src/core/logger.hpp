#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace slantcol::core
{
    /// @brief Centralized logging facility for slantcol.
    ///
    /// Provides two separate loggers:
    /// - **SLANTCOL** (core): terrain loading, geodesy, scheduling internals
    /// - **APP**: command-line tool, run summaries and user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Until then the
    /// accessors hand out a logger that discards everything, so library
    /// code may log from tests and embedding programs without setup.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("SLANTCOL").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& null_logger();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace slantcol::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SLC_CORE_TRACE(...)    ::slantcol::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SLC_CORE_DEBUG(...)    ::slantcol::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SLC_CORE_INFO(...)     ::slantcol::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SLC_CORE_WARN(...)     ::slantcol::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SLC_CORE_ERROR(...)    ::slantcol::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SLC_CORE_CRITICAL(...) ::slantcol::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SLC_TRACE(...)         ::slantcol::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SLC_INFO(...)          ::slantcol::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SLC_WARN(...)          ::slantcol::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SLC_ERROR(...)         ::slantcol::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SLC_CRITICAL(...)      ::slantcol::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
