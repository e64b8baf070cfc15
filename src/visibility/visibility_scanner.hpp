#pragma once

/// @file visibility_scanner.hpp
/// @brief Fixed-cadence elevation sampling reduced into visibility intervals.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "catalog/catalog_entry.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace uptime::visibility
{
    /// @brief Time horizon to scan: [start, end] sampled every step_seconds.
    struct ObservationWindow
    {
        f64 start_jd;       ///< Window start (UTC Julian Date)
        f64 end_jd;         ///< Window end (UTC Julian Date), > start
        f64 step_seconds;   ///< Sampling cadence, > 0

        /// @brief Build a window from two civil timestamps.
        /// @return InvalidCalendarDate for a bad timestamp, InvalidWindow for a bad span/step.
        [[nodiscard]] static core::Result<ObservationWindow> from_utc(
            const astro::DateTime& start, const astro::DateTime& end, f64 step_seconds);

        /// @brief Build a window of `duration_hours` starting at a civil timestamp.
        [[nodiscard]] static core::Result<ObservationWindow> spanning(
            const astro::DateTime& start, f64 duration_hours, f64 step_seconds);

        /// @brief InvalidWindow if step <= 0, end <= start, a value is not
        ///        finite, or the window needs more than kMaxSamples samples.
        [[nodiscard]] std::optional<core::Error> validate() const;

        [[nodiscard]] f64 duration_seconds() const
        {
            return (end_jd - start_jd) * astro_constants::kSecondsPerDay;
        }
    };

    /// @brief One point of the elevation curve.
    struct ElevationSample
    {
        f64 jd;             ///< Sample instant (UTC Julian Date)
        f64 lst_hours;      ///< Local mean sidereal time at the station [0, 24)
        f64 azimuth_deg;    ///< Azimuth [0, 360), 0 = North, 90 = East
        f64 elevation_deg;  ///< Elevation [-90, 90]
    };

    /// @brief A contiguous span during which a source is above the threshold.
    ///
    /// Unclipped boundaries are interpolated threshold crossings. A clipped
    /// boundary coincides with the window edge: the source was already up at
    /// the start (rise_clipped) or still up at the end (set_clipped).
    struct VisibilityInterval
    {
        std::string station_id;
        std::string source_id;
        f64 start_jd = 0.0;
        f64 end_jd = 0.0;
        f64 peak_elevation_deg = 0.0;   ///< Highest sampled elevation inside the interval
        f64 peak_jd = 0.0;              ///< Instant of that sample
        bool rise_clipped = false;
        bool set_clipped = false;

        [[nodiscard]] f64 duration_hours() const { return (end_jd - start_jd) * 24.0; }
    };

    /// @brief Optional adjustments applied to every sample.
    struct ScanOptions
    {
        /// Fixed offset added to the geometric elevation (a crude allowance
        /// for refraction). The result is clamped to [-90, 90].
        f64 elevation_offset_deg = 0.0;
    };

    class VisibilityScanner;

    /// @brief Lazy, finite, restartable sequence of visibility intervals for
    ///        one (station, source) pair.
    ///
    /// Samples are computed only as the sequence is iterated. Every call to
    /// begin() restarts the scan from the window start, and identical inputs
    /// always produce bit-identical intervals.
    class VisibilityScan
    {
    public:
        /// @brief Input iterator driving the BELOW/ABOVE crossing detector.
        class Iterator
        {
        public:
            using iterator_concept  = std::input_iterator_tag;
            using iterator_category = std::input_iterator_tag;
            using value_type        = VisibilityInterval;
            using difference_type   = std::ptrdiff_t;
            using pointer           = const VisibilityInterval*;
            using reference         = const VisibilityInterval&;

            Iterator() = default;

            reference operator*() const { return m_current; }
            pointer operator->() const { return &m_current; }

            Iterator& operator++()
            {
                advance();
                return *this;
            }
            void operator++(int) { advance(); }

            friend bool operator==(const Iterator& it, std::default_sentinel_t) { return it.m_done; }

        private:
            friend class VisibilityScan;

            enum class State
            {
                Below,
                Above,
            };

            Iterator(const VisibilityScan* scan, std::stop_token stop);

            void advance();
            void open_interval(f64 start_jd, bool clipped, const ElevationSample& sample);
            [[nodiscard]] f64 crossing_time(const ElevationSample& before, const ElevationSample& after) const;

            const VisibilityScan* m_scan = nullptr;
            std::stop_token m_stop;
            i64 m_next_index = 0;
            State m_state = State::Below;
            ElevationSample m_previous{};
            VisibilityInterval m_open{};
            VisibilityInterval m_current{};
            bool m_done = true;
        };

        [[nodiscard]] Iterator begin() const { return Iterator(this, {}); }

        /// @brief Start a scan that ends early once `stop` is requested.
        /// The token is polled every kStopPollSamples samples, so a long stretch
        /// without crossings can still be abandoned.
        [[nodiscard]] Iterator begin(std::stop_token stop) const { return Iterator(this, std::move(stop)); }
        [[nodiscard]] std::default_sentinel_t end() const { return {}; }

        /// @brief Run the whole scan and return every interval in time order.
        [[nodiscard]] std::vector<VisibilityInterval> collect() const;

        static constexpr i64 kStopPollSamples = 4096;

        /// @brief The raw elevation curve, one entry per sample instant.
        [[nodiscard]] std::vector<ElevationSample> samples() const;

        /// @brief Position of the source at an arbitrary instant.
        [[nodiscard]] ElevationSample evaluate(f64 jd) const;

        /// @brief Number of sample instants, end inclusive.
        [[nodiscard]] i64 sample_count() const { return m_sample_count; }

        /// @brief Instant of sample `index` (0 = window start, last = window end).
        [[nodiscard]] f64 sample_time(i64 index) const;

        [[nodiscard]] const catalog::Station& station() const { return m_station; }
        [[nodiscard]] const catalog::Source& source() const { return m_source; }
        [[nodiscard]] const ObservationWindow& window() const { return m_window; }
        [[nodiscard]] f64 threshold_deg() const { return m_threshold_deg; }

    private:
        friend class VisibilityScanner;

        VisibilityScan(catalog::Station station, catalog::Source source,
                       const ObservationWindow& window, f64 threshold_deg,
                       const ScanOptions& options);

        catalog::Station m_station;
        catalog::Source m_source;
        ObservationWindow m_window;
        f64 m_threshold_deg;
        ScanOptions m_options;

        astro::EquatorialCoord m_equatorial;
        astro::ObserverLocation m_observer;
        i64 m_sample_count;
    };

    /// @brief Entry point validating inputs and creating VisibilityScan sequences.
    class VisibilityScanner
    {
    public:
        VisibilityScanner() = delete;

        /// Upper bound on samples per scan; finer cadences are rejected.
        static constexpr i64 kMaxSamples = 10'000'000;

        /// @brief Validate one (station, source) pair and prepare its scan.
        /// @param threshold_deg Minimum elevation; "visible" means strictly above it.
        /// @return InvalidWindow, InvalidThreshold or InvalidCoordinate on bad
        ///         input, otherwise the lazy interval sequence.
        [[nodiscard]] static core::Result<VisibilityScan> scan(
            const catalog::Station& station,
            const catalog::Source& source,
            const ObservationWindow& window,
            f64 threshold_deg,
            const ScanOptions& options = {});

        /// @brief InvalidThreshold if not finite or outside [-90, 90].
        [[nodiscard]] static std::optional<core::Error> validate_threshold(f64 threshold_deg);

        /// @brief InvalidThreshold if the elevation offset is not finite or exceeds ±90°.
        [[nodiscard]] static std::optional<core::Error> validate_options(const ScanOptions& options);

        /// @brief InvalidCoordinate naming the station and the parameter.
        [[nodiscard]] static std::optional<core::Error> validate_station(const catalog::Station& station);

        /// @brief InvalidCoordinate naming the source and the parameter.
        [[nodiscard]] static std::optional<core::Error> validate_source(const catalog::Source& source);
    };

} // namespace uptime::visibility
