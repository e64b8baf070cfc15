/// @file application.cpp
/// @brief Application implementation.

#include "app/application.hpp"

#include "app/report_writer.hpp"
#include "astro/time_system.hpp"
#include "catalog/catalog_loader.hpp"
#include "core/logger.hpp"
#include "schedule/schedule_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace uptime::app
{

Application::Application(AppConfig config)
    : m_config(std::move(config))
{
    core::Logger::set_level(m_config.log_level);
}

// =================================================================
// Inputs
// =================================================================

template <typename Record>
std::vector<Record> Application::select(const std::vector<Record>& records,
                                        const std::vector<std::string>& ids,
                                        const char* kind)
{
    if (ids.empty())
    {
        return records;
    }

    std::vector<Record> selected;
    for (const std::string& id : ids)
    {
        const auto it = std::find_if(records.begin(), records.end(),
                                     [&id](const Record& record) { return record.id == id; });
        if (it == records.end())
        {
            UPT_WARN("Application: {} '{}' not found in catalog", kind, id);
            continue;
        }
        selected.push_back(*it);
    }
    return selected;
}

template std::vector<catalog::Station> Application::select(
    const std::vector<catalog::Station>&, const std::vector<std::string>&, const char*);
template std::vector<catalog::Source> Application::select(
    const std::vector<catalog::Source>&, const std::vector<std::string>&, const char*);

bool Application::load_catalogs()
{
    auto stations = catalog::CatalogLoader::load_stations(m_config.station_catalog);
    if (!stations)
    {
        UPT_ERROR("Application: No stations loaded from {}", m_config.station_catalog.string());
        return false;
    }

    auto sources = catalog::CatalogLoader::load_sources(m_config.source_catalog);
    if (!sources)
    {
        UPT_ERROR("Application: No sources loaded from {}", m_config.source_catalog.string());
        return false;
    }

    m_stations = select(*stations, m_config.stations, "station");
    m_sources = select(*sources, m_config.sources, "source");

    if (m_stations.empty() || m_sources.empty())
    {
        UPT_ERROR("Application: Selection left {} stations and {} sources",
                  m_stations.size(), m_sources.size());
        return false;
    }
    return true;
}

core::Result<visibility::ObservationWindow> Application::build_window(const AppConfig& config, f64 now_jd)
{
    if (config.start == "today")
    {
        // 0h UTC of the current day
        const f64 midnight_jd = std::floor(now_jd - 0.5) + 0.5;
        const visibility::ObservationWindow window{
            .start_jd     = midnight_jd,
            .end_jd       = midnight_jd + config.duration_hours / 24.0,
            .step_seconds = config.step_seconds,
        };
        if (auto error = window.validate())
        {
            return *error;
        }
        return window;
    }

    auto start = astro::TimeSystem::parse_utc(config.start);
    if (!start)
    {
        return start.error();
    }
    return visibility::ObservationWindow::spanning(*start, config.duration_hours, config.step_seconds);
}

// =================================================================
// Run
// =================================================================

int Application::run()
{
    if (auto error = validate_config(m_config))
    {
        UPT_ERROR("Application: {}", error->message);
        return 1;
    }

    if (!load_catalogs())
    {
        return 1;
    }

    auto window = build_window(m_config, astro::TimeSystem::now_as_jd());
    if (!window)
    {
        UPT_ERROR("Application: {}", window.error().message);
        return 1;
    }

    UPT_INFO("Application: {} .. {} every {} s, minimum elevation {} deg",
             astro::TimeSystem::format_utc(window->start_jd),
             astro::TimeSystem::format_utc(window->end_jd),
             window->step_seconds, m_config.min_elevation_deg);

    const visibility::ScanOptions options{
        .elevation_offset_deg = m_config.elevation_offset_deg,
    };

    schedule::ScheduleAggregator aggregator(schedule::AggregatorConfig{
        .worker_threads = static_cast<std::size_t>(m_config.worker_threads),
    });

    auto result = aggregator.compute_all(m_stations, m_sources, *window, m_config.min_elevation_deg, options);
    if (!result)
    {
        UPT_ERROR("Application: {} ({})", result.error().message, core::error_code_name(result.error().code));
        return 1;
    }

    ReportWriter::log_summary(*result);

    const ReportWriter writer(m_config.output_dir);
    bool exported = writer.write_intervals(*result, *window).has_value();

    if (m_config.export_tracks)
    {
        for (const catalog::Station& station : m_stations)
        {
            exported = writer.write_track(station, m_sources, *window, options).has_value() && exported;
        }
    }

    if (!exported)
    {
        UPT_WARN("Application: Some reports could not be written");
    }
    return 0;
}

} // namespace uptime::app
