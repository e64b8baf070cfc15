/// @file logger.cpp
/// @brief Engine and application spdlog loggers over a shared pair of sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>

namespace uptime::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr std::size_t kLogFileBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            const std::array<spdlog::sink_ptr, 2>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

/// Unregistered logger that drops everything; used outside init()/shutdown().
std::shared_ptr<spdlog::logger>& detached_logger()
{
    static std::shared_ptr<spdlog::logger> logger =
        std::make_shared<spdlog::logger>("detached", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

} // anonymous namespace

void Logger::init(const std::string& log_file, spdlog::level::level_enum level)
{
    if (s_core_logger)
    {
        return;
    }

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, kLogFileBytes, kLogFileCount);
    file->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] [thread %t] %v");

    const std::array<spdlog::sink_ptr, 2> sinks{console, file};
    s_core_logger = make_logger("UPTIME", sinks, level);
    s_app_logger = make_logger("APP", sinks, level);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

void Logger::set_level(spdlog::level::level_enum level)
{
    for (auto* logger : {&s_core_logger, &s_app_logger})
    {
        if (*logger)
        {
            (*logger)->set_level(level);
        }
    }
}

bool Logger::is_initialized()
{
    return s_core_logger != nullptr;
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger ? s_core_logger : detached_logger();
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger ? s_app_logger : detached_logger();
}

} // namespace uptime::core
