/// @file catalog_loader.cpp
/// @brief Implementation of the station and source catalog loaders.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"
#include "core/types.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <string>

namespace uptime::catalog
{

// -----------------------------------------------------------------
// Stations: NAME X Y Z (ECEF meters)
// -----------------------------------------------------------------

std::optional<std::vector<Station>>
CatalogLoader::load_stations(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        UPT_CORE_ERROR("CatalogLoader: Failed to open station file: {}", path.string());
        return std::nullopt;
    }

    std::vector<Station> stations;
    std::string line;
    u32 line_number = 0;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (is_ignorable(line))
        {
            continue;
        }

        const auto fields = split_fields(line);
        if (fields.size() != 4)
        {
            UPT_CORE_WARN("CatalogLoader: Malformed station line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto x = parse_f64(fields[1]);
        const auto y = parse_f64(fields[2]);
        const auto z = parse_f64(fields[3]);

        if (!x || !y || !z)
        {
            UPT_CORE_WARN("CatalogLoader: Failed to parse position on station line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        stations.push_back(Station::from_geocentric(std::string(fields[0]), Vec3d{*x, *y, *z}));
    }

    if (stations.empty())
    {
        UPT_CORE_ERROR("CatalogLoader: No valid stations found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        UPT_CORE_WARN("CatalogLoader: Skipped {} malformed station lines", skipped);
    }

    UPT_CORE_INFO("CatalogLoader: Loaded {} stations from {}", stations.size(), path.string());

    return stations;
}

// -----------------------------------------------------------------
// Sources: NAME RA_H RA_M RA_S DEC_D DEC_M DEC_S
// -----------------------------------------------------------------

std::optional<std::vector<Source>>
CatalogLoader::load_sources(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        UPT_CORE_ERROR("CatalogLoader: Failed to open source file: {}", path.string());
        return std::nullopt;
    }

    std::vector<Source> sources;
    std::string line;
    u32 line_number = 0;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (is_ignorable(line))
        {
            continue;
        }

        const auto fields = split_fields(line);
        if (fields.size() < 7)
        {
            UPT_CORE_WARN("CatalogLoader: Malformed source line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto ra_deg  = parse_right_ascension(fields[1], fields[2], fields[3]);
        const auto dec_deg = parse_declination(fields[4], fields[5], fields[6]);

        if (!ra_deg || !dec_deg)
        {
            UPT_CORE_WARN("CatalogLoader: Invalid coordinates on source line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        sources.push_back(Source{
            .id      = std::string(fields[0]),
            .ra_deg  = *ra_deg,
            .dec_deg = *dec_deg,
        });
    }

    if (sources.empty())
    {
        UPT_CORE_ERROR("CatalogLoader: No valid sources found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        UPT_CORE_WARN("CatalogLoader: Skipped {} malformed source lines", skipped);
    }

    UPT_CORE_INFO("CatalogLoader: Loaded {} sources from {}", sources.size(), path.string());

    return sources;
}

// -----------------------------------------------------------------
// Sexagesimal conversions
// -----------------------------------------------------------------

std::optional<f64> CatalogLoader::parse_right_ascension(
    std::string_view hours, std::string_view minutes, std::string_view seconds)
{
    const auto h = parse_f64(hours);
    const auto m = parse_f64(minutes);
    const auto s = parse_f64(seconds);

    if (!h || !m || !s)
    {
        return std::nullopt;
    }
    if (*h < 0.0 || *h >= 24.0 || *m < 0.0 || *m >= 60.0 || *s < 0.0 || *s >= 60.0)
    {
        return std::nullopt;
    }

    const f64 ra_deg = (*h + *m / 60.0 + *s / 3600.0) * 15.0;
    return (ra_deg >= 360.0) ? ra_deg - 360.0 : ra_deg;
}

std::optional<f64> CatalogLoader::parse_declination(
    std::string_view degrees, std::string_view minutes, std::string_view seconds)
{
    degrees = trim(degrees);
    const bool negative = !degrees.empty() && degrees.front() == '-';

    const auto d = parse_f64(degrees);
    const auto m = parse_f64(minutes);
    const auto s = parse_f64(seconds);

    if (!d || !m || !s)
    {
        return std::nullopt;
    }
    if (std::abs(*d) > 90.0 || *m < 0.0 || *m >= 60.0 || *s < 0.0 || *s >= 60.0)
    {
        return std::nullopt;
    }

    const f64 magnitude = std::abs(*d) + *m / 60.0 + *s / 3600.0;
    if (magnitude > 90.0)
    {
        return std::nullopt;
    }

    return negative ? -magnitude : magnitude;
}

// -----------------------------------------------------------------
// Utility: field splitting and comment detection
// -----------------------------------------------------------------

std::vector<std::string_view> CatalogLoader::split_fields(std::string_view line)
{
    std::vector<std::string_view> fields;

    std::size_t pos = 0;
    while (pos < line.size())
    {
        const std::size_t start = line.find_first_not_of(" \t\r", pos);
        if (start == std::string_view::npos)
        {
            break;
        }
        std::size_t end = line.find_first_of(" \t\r", start);
        if (end == std::string_view::npos)
        {
            end = line.size();
        }
        fields.push_back(line.substr(start, end - start));
        pos = end;
    }

    return fields;
}

bool CatalogLoader::is_ignorable(std::string_view line)
{
    const std::string_view trimmed = trim(line);
    return trimmed.empty() || trimmed.front() == '*' || trimmed.front() == '#';
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogLoader::parse_f64(std::string_view sv)
{
    sv = trim(sv);

    // std::from_chars rejects an explicit plus sign
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
    {
        return std::nullopt;
    }

    return value;
}

} // namespace uptime::catalog
