/// @file schedule_aggregator.cpp
/// @brief Parallel fan-out of visibility scans over (station, source) pairs.

#include "schedule/schedule_aggregator.hpp"

#include "core/logger.hpp"

#include <future>
#include <set>
#include <utility>

namespace uptime::schedule
{

namespace
{

core::Error cancelled()
{
    return core::make_error(core::ErrorCode::Cancelled, "visibility computation was cancelled");
}

/// One pair, run on a worker thread. Inputs are owned copies.
PairOutcome scan_pair(const catalog::Station& station,
                      const catalog::Source& source,
                      const visibility::ObservationWindow& window,
                      f64 threshold_deg,
                      const visibility::ScanOptions& options,
                      const std::stop_token& stop)
{
    if (stop.stop_requested())
    {
        return cancelled();
    }

    auto scan = visibility::VisibilityScanner::scan(station, source, window, threshold_deg, options);
    if (!scan)
    {
        return scan.error();
    }

    std::vector<visibility::VisibilityInterval> intervals;
    for (auto it = scan->begin(stop); it != scan->end(); ++it)
    {
        intervals.push_back(*it);
    }

    // The iterator stops early on request, so a short list may be partial
    if (stop.stop_requested())
    {
        return cancelled();
    }
    return intervals;
}

} // anonymous namespace

// =================================================================
// ScheduleResult
// =================================================================

const PairOutcome* ScheduleResult::find(std::string_view station_id, std::string_view source_id) const
{
    const auto it = pairs.find(PairKey{
        .station_id = std::string(station_id),
        .source_id  = std::string(source_id),
    });
    return (it != pairs.end()) ? &it->second : nullptr;
}

std::size_t ScheduleResult::interval_count() const
{
    std::size_t count = 0;
    for (const auto& [key, outcome] : pairs)
    {
        if (outcome)
        {
            count += outcome->size();
        }
    }
    return count;
}

std::size_t ScheduleResult::error_count() const
{
    std::size_t count = 0;
    for (const auto& [key, outcome] : pairs)
    {
        if (!outcome)
        {
            ++count;
        }
    }
    return count;
}

// =================================================================
// ScheduleAggregator
// =================================================================

ScheduleAggregator::ScheduleAggregator(const AggregatorConfig& config)
    : m_pool(config.worker_threads)
{
}

core::Result<ScheduleResult> ScheduleAggregator::compute_all(
    const std::vector<catalog::Station>& stations,
    const std::vector<catalog::Source>& sources,
    const visibility::ObservationWindow& window,
    f64 threshold_deg,
    const visibility::ScanOptions& options,
    std::stop_token stop)
{
    if (auto error = window.validate())
    {
        UPT_CORE_ERROR("ScheduleAggregator: {}", error->message);
        return *error;
    }
    if (auto error = visibility::VisibilityScanner::validate_threshold(threshold_deg))
    {
        UPT_CORE_ERROR("ScheduleAggregator: {}", error->message);
        return *error;
    }
    if (auto error = visibility::VisibilityScanner::validate_options(options))
    {
        UPT_CORE_ERROR("ScheduleAggregator: {}", error->message);
        return *error;
    }

    UPT_CORE_INFO("ScheduleAggregator: Scanning {} stations x {} sources on {} workers",
                  stations.size(), sources.size(), m_pool.size());

    // Dispatch one task per distinct pair
    std::vector<std::pair<PairKey, std::future<PairOutcome>>> pending;
    pending.reserve(stations.size() * sources.size());
    std::set<PairKey> seen;

    for (const catalog::Station& station : stations)
    {
        for (const catalog::Source& source : sources)
        {
            PairKey key{
                .station_id = station.id,
                .source_id  = source.id,
            };

            if (!seen.insert(key).second)
            {
                UPT_CORE_WARN("ScheduleAggregator: Duplicate pair ({}, {}) skipped",
                              key.station_id, key.source_id);
                continue;
            }

            auto future = m_pool.enqueue(
                [station, source, window, threshold_deg, options, stop] {
                    return scan_pair(station, source, window, threshold_deg, options, stop);
                });
            pending.emplace_back(std::move(key), std::move(future));
        }
    }

    // Collect every future so no task outlives this call
    ScheduleResult result;
    for (auto& [key, future] : pending)
    {
        PairOutcome outcome = future.get();
        if (!outcome && outcome.error().code != core::ErrorCode::Cancelled)
        {
            UPT_CORE_WARN("ScheduleAggregator: Pair ({}, {}) failed: {}",
                          key.station_id, key.source_id, outcome.error().message);
        }
        result.pairs.emplace(std::move(key), std::move(outcome));
    }

    if (stop.stop_requested())
    {
        UPT_CORE_WARN("ScheduleAggregator: Cancelled, discarding {} pair results", result.pairs.size());
        return cancelled();
    }

    UPT_CORE_INFO("ScheduleAggregator: {} intervals over {} pairs ({} failed)",
                  result.interval_count(), result.pairs.size(), result.error_count());

    return result;
}

core::Result<std::vector<visibility::ElevationSample>> ScheduleAggregator::track(
    const catalog::Station& station,
    const catalog::Source& source,
    const visibility::ObservationWindow& window,
    const visibility::ScanOptions& options)
{
    // The threshold plays no part in the raw curve
    auto scan = visibility::VisibilityScanner::scan(station, source, window, 0.0, options);
    if (!scan)
    {
        return scan.error();
    }
    return scan->samples();
}

// =================================================================
// One-shot entry point
// =================================================================

core::Result<ScheduleResult> compute_visibility(
    const std::vector<catalog::Station>& stations,
    const std::vector<catalog::Source>& sources,
    const visibility::ObservationWindow& window,
    f64 min_elevation_deg,
    const visibility::ScanOptions& options)
{
    ScheduleAggregator aggregator;
    return aggregator.compute_all(stations, sources, window, min_elevation_deg, options);
}

} // namespace uptime::schedule
