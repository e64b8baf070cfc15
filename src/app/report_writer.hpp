#pragma once

/// @file report_writer.hpp
/// @brief CSV export of visibility intervals and elevation tracks, plus console summaries.

#include "catalog/catalog_entry.hpp"
#include "schedule/schedule_aggregator.hpp"
#include "visibility/visibility_scanner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uptime::app
{
    /// @brief Writes run results below one output directory.
    ///
    /// Files are named after the UTC date of the window start:
    /// - intervals_YYYYMMDD.csv: one row per interval or failed pair
    /// - track_YYYYMMDD_<station>.csv: UT hours, LST hours, then az/el per source
    class ReportWriter
    {
    public:
        explicit ReportWriter(std::filesystem::path output_dir);

        /// @return Path of the written file, or std::nullopt (reason logged).
        [[nodiscard]] std::optional<std::filesystem::path> write_intervals(
            const schedule::ScheduleResult& result,
            const visibility::ObservationWindow& window) const;

        /// @brief Sample every source over the window from one station and write the curves.
        ///
        /// Sources with invalid coordinates are left out with a warning.
        /// @return Path of the written file, or std::nullopt (reason logged).
        [[nodiscard]] std::optional<std::filesystem::path> write_track(
            const catalog::Station& station,
            const std::vector<catalog::Source>& sources,
            const visibility::ObservationWindow& window,
            const visibility::ScanOptions& options = {}) const;

        /// @brief Log one line per pair through the application logger.
        static void log_summary(const schedule::ScheduleResult& result);

        /// @brief "YYYYMMDD" of the window start.
        [[nodiscard]] static std::string date_tag(const visibility::ObservationWindow& window);

        /// @brief One CSV row (no newline) describing an interval.
        [[nodiscard]] static std::string format_interval_row(const visibility::VisibilityInterval& interval);

    private:
        [[nodiscard]] bool ensure_output_dir() const;

        std::filesystem::path m_output_dir;
    };

} // namespace uptime::app
