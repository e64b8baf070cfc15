/// @file report_writer.cpp
/// @brief ReportWriter implementation.

#include "app/report_writer.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>
#include <utility>

namespace uptime::app
{

namespace
{

constexpr const char* kIntervalHeader =
    "station,source,start_utc,end_utc,duration_hours,peak_elevation_deg,peak_utc,"
    "rise_clipped,set_clipped,error";

const char* flag(bool value)
{
    return value ? "true" : "false";
}

/// Julian Date of 0h UTC on the civil day containing jd.
f64 start_of_day(f64 jd)
{
    return std::floor(jd - 0.5) + 0.5;
}

} // anonymous namespace

ReportWriter::ReportWriter(std::filesystem::path output_dir)
    : m_output_dir(std::move(output_dir))
{
}

bool ReportWriter::ensure_output_dir() const
{
    std::error_code ec;
    std::filesystem::create_directories(m_output_dir, ec);
    if (ec)
    {
        UPT_ERROR("ReportWriter: Cannot create {}: {}", m_output_dir.string(), ec.message());
        return false;
    }
    return true;
}

std::string ReportWriter::date_tag(const visibility::ObservationWindow& window)
{
    const astro::DateTime dt = astro::TimeSystem::from_julian_date(window.start_jd);
    return fmt::format("{:04d}{:02d}{:02d}", dt.year, dt.month, dt.day);
}

std::string ReportWriter::format_interval_row(const visibility::VisibilityInterval& interval)
{
    return fmt::format("{},{},{},{},{:.4f},{:.3f},{},{},{},",
                       interval.station_id,
                       interval.source_id,
                       astro::TimeSystem::format_utc(interval.start_jd),
                       astro::TimeSystem::format_utc(interval.end_jd),
                       interval.duration_hours(),
                       interval.peak_elevation_deg,
                       astro::TimeSystem::format_utc(interval.peak_jd),
                       flag(interval.rise_clipped),
                       flag(interval.set_clipped));
}

// =================================================================
// Interval table
// =================================================================

std::optional<std::filesystem::path> ReportWriter::write_intervals(
    const schedule::ScheduleResult& result,
    const visibility::ObservationWindow& window) const
{
    if (!ensure_output_dir())
    {
        return std::nullopt;
    }

    const std::filesystem::path path = m_output_dir / fmt::format("intervals_{}.csv", date_tag(window));
    std::ofstream file(path);
    if (!file.is_open())
    {
        UPT_ERROR("ReportWriter: Failed to open {}", path.string());
        return std::nullopt;
    }

    file << kIntervalHeader << '\n';
    for (const auto& [key, outcome] : result.pairs)
    {
        if (!outcome)
        {
            // Commas would break the column layout
            std::string message = outcome.error().message;
            std::replace(message.begin(), message.end(), ',', ';');
            file << fmt::format("{},{},,,,,,,,{}: {}\n", key.station_id, key.source_id,
                                core::error_code_name(outcome.error().code), message);
            continue;
        }
        for (const visibility::VisibilityInterval& interval : *outcome)
        {
            file << format_interval_row(interval) << '\n';
        }
    }

    if (!file)
    {
        UPT_ERROR("ReportWriter: Write error on {}", path.string());
        return std::nullopt;
    }

    UPT_INFO("ReportWriter: Wrote {} intervals to {}", result.interval_count(), path.string());
    return path;
}

// =================================================================
// Elevation tracks
// =================================================================

std::optional<std::filesystem::path> ReportWriter::write_track(
    const catalog::Station& station,
    const std::vector<catalog::Source>& sources,
    const visibility::ObservationWindow& window,
    const visibility::ScanOptions& options) const
{
    if (auto error = visibility::VisibilityScanner::validate_station(station))
    {
        UPT_ERROR("ReportWriter: {}", error->message);
        return std::nullopt;
    }

    // Every track shares the window's sample instants, so rows line up
    std::vector<const catalog::Source*> columns;
    std::vector<std::vector<visibility::ElevationSample>> tracks;
    for (const catalog::Source& source : sources)
    {
        auto track = schedule::ScheduleAggregator::track(station, source, window, options);
        if (!track)
        {
            UPT_WARN("ReportWriter: Track of {} from {} skipped: {}",
                     source.id, station.id, track.error().message);
            continue;
        }
        columns.push_back(&source);
        tracks.push_back(std::move(*track));
    }

    if (tracks.empty())
    {
        UPT_WARN("ReportWriter: No valid source to track from {}", station.id);
        return std::nullopt;
    }

    if (!ensure_output_dir())
    {
        return std::nullopt;
    }

    const std::filesystem::path path =
        m_output_dir / fmt::format("track_{}_{}.csv", date_tag(window), station.id);
    std::ofstream file(path);
    if (!file.is_open())
    {
        UPT_ERROR("ReportWriter: Failed to open {}", path.string());
        return std::nullopt;
    }

    file << "utc,ut_hours,lst_hours";
    for (const catalog::Source* source : columns)
    {
        file << fmt::format(",{0}_az_deg,{0}_el_deg", source->id);
    }
    file << '\n';

    const f64 day_start = start_of_day(window.start_jd);
    const std::vector<visibility::ElevationSample>& reference = tracks.front();

    for (std::size_t row = 0; row < reference.size(); ++row)
    {
        const visibility::ElevationSample& sample = reference[row];
        file << fmt::format("{},{:.5f},{:.5f}",
                            astro::TimeSystem::format_utc(sample.jd),
                            (sample.jd - day_start) * 24.0,
                            sample.lst_hours);
        for (const auto& track : tracks)
        {
            file << fmt::format(",{:.3f},{:.3f}", track[row].azimuth_deg, track[row].elevation_deg);
        }
        file << '\n';
    }

    if (!file)
    {
        UPT_ERROR("ReportWriter: Write error on {}", path.string());
        return std::nullopt;
    }

    UPT_INFO("ReportWriter: Wrote {} samples x {} sources to {}",
             reference.size(), tracks.size(), path.string());
    return path;
}

// =================================================================
// Console summary
// =================================================================

void ReportWriter::log_summary(const schedule::ScheduleResult& result)
{
    for (const auto& [key, outcome] : result.pairs)
    {
        if (!outcome)
        {
            UPT_WARN("{:>10} {:<12} {}", key.station_id, key.source_id, outcome.error().message);
            continue;
        }
        if (outcome->empty())
        {
            UPT_INFO("{:>10} {:<12} never above threshold", key.station_id, key.source_id);
            continue;
        }

        f64 total_hours = 0.0;
        for (const visibility::VisibilityInterval& interval : *outcome)
        {
            total_hours += interval.duration_hours();
        }
        UPT_INFO("{:>10} {:<12} {} interval(s), {:.2f} h visible", key.station_id, key.source_id,
                 outcome->size(), total_hours);

        for (const visibility::VisibilityInterval& interval : *outcome)
        {
            UPT_INFO("{:>10} {:<12}   {}{} .. {}{}  peak {:.1f} deg", "", "",
                     interval.rise_clipped ? "[" : " ",
                     astro::TimeSystem::format_utc(interval.start_jd),
                     astro::TimeSystem::format_utc(interval.end_jd),
                     interval.set_clipped ? "]" : " ",
                     interval.peak_elevation_deg);
        }
    }
}

} // namespace uptime::app
