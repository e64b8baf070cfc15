/// @file config.cpp
/// @brief JSON config loading (nlohmann::json) and command-line parsing.

#include "app/config.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <fstream>
#include <sstream>

namespace uptime::app
{

namespace
{

using json = nlohmann::json;

core::Error config_error(std::string message)
{
    return core::make_error(core::ErrorCode::ConfigError, std::move(message));
}

/// spdlog maps unknown names to "off", so that case is checked by hand.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name)
{
    const spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off")
    {
        return std::nullopt;
    }
    return level;
}

} // anonymous namespace

// =================================================================
// Command line
// =================================================================

core::Result<CommandLine> parse_command_line(std::span<const std::string_view> args)
{
    CommandLine command_line;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help")
        {
            command_line.show_help = true;
        }
        else if (arg == "--station-path" || arg == "--source-path")
        {
            if (i + 1 >= args.size())
            {
                return config_error(fmt::format("option {} needs a path", arg));
            }
            const std::filesystem::path value{std::string(args[++i])};
            if (arg == "--station-path")
            {
                command_line.station_path = value;
            }
            else
            {
                command_line.source_path = value;
            }
        }
        else if (arg.starts_with("-"))
        {
            return config_error(fmt::format("unknown option '{}'", arg));
        }
        else if (command_line.config_path)
        {
            return config_error(fmt::format("unexpected argument '{}'", arg));
        }
        else
        {
            command_line.config_path = std::filesystem::path{std::string(arg)};
        }
    }

    return command_line;
}

std::string usage()
{
    return "Usage: uptime [config.json] [--station-path PATH] [--source-path PATH]\n"
           "\n"
           "  config.json          JSON run configuration (defaults are used when omitted)\n"
           "  --station-path PATH  Station catalog (NAME X Y Z, ECEF meters)\n"
           "  --source-path PATH   Source catalog (NAME RA_H RA_M RA_S DEC_D DEC_M DEC_S)\n"
           "  -h, --help           Show this text\n";
}

// =================================================================
// JSON
// =================================================================

std::optional<AppConfig> parse_config(std::string_view json_text)
{
    AppConfig config;

    try
    {
        const json j = json::parse(json_text);
        if (!j.is_object())
        {
            UPT_CORE_ERROR("Config: top-level value must be an object");
            return std::nullopt;
        }

        config.station_catalog = j.value("station_catalog", config.station_catalog.string());
        config.source_catalog  = j.value("source_catalog", config.source_catalog.string());

        config.start                = j.value("start", config.start);
        config.duration_hours       = j.value("duration_hours", config.duration_hours);
        config.step_seconds         = j.value("step_seconds", config.step_seconds);
        config.min_elevation_deg    = j.value("min_elevation_deg", config.min_elevation_deg);
        config.elevation_offset_deg = j.value("elevation_offset_deg", config.elevation_offset_deg);
        if (j.contains("worker_threads") && !j.at("worker_threads").is_number_integer())
        {
            UPT_CORE_ERROR("Config: worker_threads must be an integer");
            return std::nullopt;
        }
        config.worker_threads = j.value("worker_threads", config.worker_threads);

        config.stations = j.value("stations", config.stations);
        config.sources  = j.value("sources", config.sources);

        config.output_dir    = j.value("output_dir", config.output_dir.string());
        config.export_tracks = j.value("export_tracks", config.export_tracks);

        const std::string level_name = j.value("log_level", std::string("info"));
        const auto level = parse_log_level(level_name);
        if (!level)
        {
            UPT_CORE_ERROR("Config: unknown log_level '{}'", level_name);
            return std::nullopt;
        }
        config.log_level = *level;
    }
    catch (const json::exception& e)
    {
        UPT_CORE_ERROR("Config: {}", e.what());
        return std::nullopt;
    }

    if (auto error = validate_config(config))
    {
        UPT_CORE_ERROR("Config: {}", error->message);
        return std::nullopt;
    }

    return config;
}

std::optional<AppConfig> load_config(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        UPT_CORE_ERROR("Config: Failed to open {}", path.string());
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (config)
    {
        UPT_CORE_INFO("Config: Loaded {}", path.string());
    }
    return config;
}

std::optional<core::Error> validate_config(const AppConfig& config)
{
    if (!std::isfinite(config.duration_hours) || config.duration_hours <= 0.0)
    {
        return config_error(fmt::format("duration_hours must be positive, got {}", config.duration_hours));
    }
    if (!std::isfinite(config.step_seconds) || config.step_seconds <= 0.0)
    {
        return config_error(fmt::format("step_seconds must be positive, got {}", config.step_seconds));
    }
    if (!std::isfinite(config.min_elevation_deg) || std::abs(config.min_elevation_deg) > 90.0)
    {
        return config_error(fmt::format("min_elevation_deg {} outside [-90, 90]", config.min_elevation_deg));
    }
    if (!std::isfinite(config.elevation_offset_deg) || std::abs(config.elevation_offset_deg) > 90.0)
    {
        return config_error(fmt::format("elevation_offset_deg {} outside [-90, 90]",
                                        config.elevation_offset_deg));
    }
    if (config.worker_threads < 0 || config.worker_threads > kMaxWorkerThreads)
    {
        return config_error(fmt::format("worker_threads {} outside [0, {}]",
                                        config.worker_threads, kMaxWorkerThreads));
    }
    if (config.start != "today")
    {
        auto start = astro::TimeSystem::parse_utc(config.start);
        if (!start)
        {
            return config_error(fmt::format("start: {}", start.error().message));
        }
    }
    return std::nullopt;
}

void apply_overrides(AppConfig& config, const CommandLine& command_line)
{
    if (command_line.station_path)
    {
        config.station_catalog = *command_line.station_path;
    }
    if (command_line.source_path)
    {
        config.source_catalog = *command_line.source_path;
    }
}

} // namespace uptime::app
