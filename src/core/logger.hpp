#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace uptime::core
{
    /// @brief Centralized logging facility for Uptime.
    ///
    /// Provides two separate loggers:
    /// - **UPTIME** (core): scheduling engine internals, catalog loading
    /// - **APP**: command line front end, user-facing summaries
    ///
    /// Both write to colored console output and a rotating log file once
    /// init() has run; until then the macros are silent.
    class Logger
    {
    public:
        /// @brief Create both loggers over a colored console sink and a rotating
        /// file sink (5 MB x 3). A second call is a no-op.
        static void init(const std::string& log_file = "uptime.log",
                         spdlog::level::level_enum level = spdlog::level::info);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Apply one level to both loggers (ignored before init()).
        static void set_level(spdlog::level::level_enum level);

        [[nodiscard]] static bool is_initialized();

        /// @brief Access the engine-internal logger ("UPTIME").
        /// Before init() and after shutdown() both accessors return a logger
        /// that discards its messages, so library callers need no setup.
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace uptime::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define UPT_CORE_TRACE(...)    ::uptime::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define UPT_CORE_DEBUG(...)    ::uptime::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define UPT_CORE_INFO(...)     ::uptime::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define UPT_CORE_WARN(...)     ::uptime::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define UPT_CORE_ERROR(...)    ::uptime::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define UPT_CORE_CRITICAL(...) ::uptime::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define UPT_TRACE(...)         ::uptime::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define UPT_INFO(...)          ::uptime::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define UPT_WARN(...)          ::uptime::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define UPT_ERROR(...)         ::uptime::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define UPT_CRITICAL(...)      ::uptime::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
