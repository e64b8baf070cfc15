#pragma once

/// @file config.hpp
/// @brief Run configuration: JSON file plus command-line overrides.

#include "core/result.hpp"
#include "core/types.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uptime::app
{
    inline constexpr i64 kMaxWorkerThreads = 1024;

    /// @brief Everything one scheduling run needs.
    struct AppConfig
    {
        std::filesystem::path station_catalog{"data/station.txt"};
        std::filesystem::path source_catalog{"data/source.txt"};

        std::string start{"today"};     ///< "today" (0h UTC) or an ISO-8601 UTC timestamp
        f64 duration_hours = 24.0;
        f64 step_seconds = 180.0;
        f64 min_elevation_deg = 0.0;
        f64 elevation_offset_deg = 0.0;
        i64 worker_threads = 0;         ///< 0 = hardware concurrency, at most kMaxWorkerThreads

        std::vector<std::string> stations;  ///< Station ids to keep, empty = all
        std::vector<std::string> sources;   ///< Source ids to keep, empty = all

        std::filesystem::path output_dir{"uptime_output"};
        bool export_tracks = true;
        spdlog::level::level_enum log_level = spdlog::level::info;
    };

    /// @brief Parsed command line: `uptime [config.json] [--station-path P] [--source-path P]`.
    struct CommandLine
    {
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> station_path;
        std::optional<std::filesystem::path> source_path;
        bool show_help = false;
    };

    /// @brief Parse arguments (without the program name).
    /// @return ConfigError for an unknown option, a missing value or a second positional argument.
    [[nodiscard]] core::Result<CommandLine> parse_command_line(std::span<const std::string_view> args);

    /// @brief Usage text printed for --help.
    [[nodiscard]] std::string usage();

    /// @brief Parse a JSON document into a config. Missing keys keep their defaults.
    /// @return The config, or std::nullopt (reason logged) on malformed JSON,
    ///         wrong value types or values that fail validate_config().
    [[nodiscard]] std::optional<AppConfig> parse_config(std::string_view json_text);

    /// @brief Read and parse a JSON config file.
    [[nodiscard]] std::optional<AppConfig> load_config(const std::filesystem::path& path);

    /// @brief ConfigError if a numeric setting or the start timestamp is unusable.
    [[nodiscard]] std::optional<core::Error> validate_config(const AppConfig& config);

    /// @brief Catalog path overrides from the command line win over the file.
    void apply_overrides(AppConfig& config, const CommandLine& command_line);

} // namespace uptime::app
