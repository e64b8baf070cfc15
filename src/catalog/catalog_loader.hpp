#pragma once

/// @file catalog_loader.hpp
/// @brief Loads station and source catalogs from whitespace-separated text files.

#include "catalog/catalog_entry.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace uptime::catalog
{
    /// @brief Static utility class for loading station and source catalog files.
    ///
    /// Both formats are one record per line, fields separated by blanks.
    /// Empty lines and lines starting with '*' or '#' are ignored. Malformed
    /// lines are logged and skipped; a file with no valid record fails.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Load antenna stations given as WGS84 ECEF positions.
        ///
        /// Line format:
        ///   NAME X_m Y_m Z_m
        /// e.g. "YAMAGU32 -3502544.587 3950966.235 3566381.192"
        ///
        /// @param path Path to the station file.
        /// @return Stations on success, std::nullopt on failure.
        [[nodiscard]] static std::optional<std::vector<Station>>
            load_stations(const std::filesystem::path& path);

        /// @brief Load sources given in sexagesimal J2000 coordinates.
        ///
        /// Line format:
        ///   NAME RA_H RA_M RA_S DEC_D DEC_M DEC_S
        /// e.g. "3C273 12 29 06.7 +02 03 08.6"
        ///
        /// The declination sign is taken from the text of DEC_D, so
        /// "-00 30 00" is half a degree south.
        ///
        /// @param path Path to the source file.
        /// @return Sources on success, std::nullopt on failure.
        [[nodiscard]] static std::optional<std::vector<Source>>
            load_sources(const std::filesystem::path& path);

        /// @brief Sexagesimal right ascension → decimal degrees.
        /// @return std::nullopt unless h in [0, 24), m and s in [0, 60).
        [[nodiscard]] static std::optional<f64> parse_right_ascension(
            std::string_view hours, std::string_view minutes, std::string_view seconds);

        /// @brief Sexagesimal declination → decimal degrees.
        /// @return std::nullopt unless |d| <= 90, m and s in [0, 60) and the
        ///         result lies within [-90, 90].
        [[nodiscard]] static std::optional<f64> parse_declination(
            std::string_view degrees, std::string_view minutes, std::string_view seconds);

    private:
        /// @brief Split a line into blank-separated fields.
        [[nodiscard]] static std::vector<std::string_view> split_fields(std::string_view line);

        /// @brief True for empty lines and '*' / '#' comment lines.
        [[nodiscard]] static bool is_ignorable(std::string_view line);

        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value (an optional leading '+' is accepted).
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace uptime::catalog
