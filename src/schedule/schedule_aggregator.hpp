#pragma once

/// @file schedule_aggregator.hpp
/// @brief Visibility intervals for every (station, source) pair, computed in parallel.

#include "catalog/catalog_entry.hpp"
#include "core/result.hpp"
#include "core/thread_pool.hpp"
#include "core/types.hpp"
#include "visibility/visibility_scanner.hpp"

#include <compare>
#include <cstddef>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace uptime::schedule
{
    /// @brief Result key: one station observing one source.
    struct PairKey
    {
        std::string station_id;
        std::string source_id;

        auto operator<=>(const PairKey&) const = default;
    };

    /// @brief Time-ordered intervals of one pair, or the reason the pair failed.
    using PairOutcome = core::Result<std::vector<visibility::VisibilityInterval>>;

    /// @brief Combined output of one aggregation run.
    struct ScheduleResult
    {
        std::map<PairKey, PairOutcome> pairs;

        /// @return The outcome for a pair, or nullptr if the pair was not computed.
        [[nodiscard]] const PairOutcome* find(std::string_view station_id,
                                              std::string_view source_id) const;

        /// @brief Total intervals across all successful pairs.
        [[nodiscard]] std::size_t interval_count() const;

        /// @brief Number of pairs that failed.
        [[nodiscard]] std::size_t error_count() const;
    };

    struct AggregatorConfig
    {
        std::size_t worker_threads = 0;   ///< 0 = hardware concurrency
    };

    /// @brief Runs VisibilityScanner over the Cartesian product of stations and sources.
    ///
    /// Each pair is an independent task on a fixed-size worker pool; tasks
    /// share no mutable state. A failing pair (e.g. a source with an invalid
    /// declination) yields an error entry for its key without affecting the
    /// other pairs.
    class ScheduleAggregator
    {
    public:
        explicit ScheduleAggregator(const AggregatorConfig& config = {});

        /// @brief Compute visibility intervals for every (station, source) pair.
        ///
        /// Window and threshold problems are global and fail the whole call
        /// (InvalidWindow / InvalidThreshold). If `stop` is triggered before all
        /// pairs finish, pending pairs are abandoned and the call fails with
        /// Cancelled; partial results are discarded.
        [[nodiscard]] core::Result<ScheduleResult> compute_all(
            const std::vector<catalog::Station>& stations,
            const std::vector<catalog::Source>& sources,
            const visibility::ObservationWindow& window,
            f64 threshold_deg,
            const visibility::ScanOptions& options = {},
            std::stop_token stop = {});

        /// @brief Raw elevation curve of one pair, for plotting.
        [[nodiscard]] static core::Result<std::vector<visibility::ElevationSample>> track(
            const catalog::Station& station,
            const catalog::Source& source,
            const visibility::ObservationWindow& window,
            const visibility::ScanOptions& options = {});

        [[nodiscard]] std::size_t worker_count() const { return m_pool.size(); }

    private:
        core::ThreadPool m_pool;
    };

    /// @brief One-shot entry point for presentation code.
    ///
    /// @return Mapping (station id, source id) → ordered intervals, or
    ///         InvalidWindow / InvalidThreshold.
    [[nodiscard]] core::Result<ScheduleResult> compute_visibility(
        const std::vector<catalog::Station>& stations,
        const std::vector<catalog::Source>& sources,
        const visibility::ObservationWindow& window,
        f64 min_elevation_deg,
        const visibility::ScanOptions& options = {});

} // namespace uptime::schedule
