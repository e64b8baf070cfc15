/// @file visibility_scanner.cpp
/// @brief Elevation sampling and threshold-crossing detection.

#include "visibility/visibility_scanner.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace uptime::visibility
{

namespace
{

/// Remainders shorter than this do not earn an extra final sample.
constexpr f64 kSampleAlignmentToleranceSec = 1e-3;

/// Number of whole steps in the window, allowing for JD rounding.
i64 whole_steps(const ObservationWindow& window)
{
    return static_cast<i64>(std::floor(window.duration_seconds() / window.step_seconds + 1e-9));
}

i64 compute_sample_count(const ObservationWindow& window)
{
    const i64 steps = whole_steps(window);
    const f64 remainder = window.duration_seconds() - static_cast<f64>(steps) * window.step_seconds;

    // Window end is always sampled, even when the span is not a multiple of the step
    const i64 count = (remainder > kSampleAlignmentToleranceSec) ? steps + 2 : steps + 1;
    return std::max<i64>(count, 2);
}

} // anonymous namespace

// =================================================================
// ObservationWindow
// =================================================================

core::Result<ObservationWindow> ObservationWindow::from_utc(
    const astro::DateTime& start, const astro::DateTime& end, f64 step_seconds)
{
    auto start_jd = astro::TimeSystem::to_julian_date(start);
    if (!start_jd)
    {
        return core::make_error(start_jd.error().code, "window start: " + start_jd.error().message);
    }

    auto end_jd = astro::TimeSystem::to_julian_date(end);
    if (!end_jd)
    {
        return core::make_error(end_jd.error().code, "window end: " + end_jd.error().message);
    }

    const ObservationWindow window{
        .start_jd     = *start_jd,
        .end_jd       = *end_jd,
        .step_seconds = step_seconds,
    };

    if (auto error = window.validate())
    {
        return *error;
    }
    return window;
}

core::Result<ObservationWindow> ObservationWindow::spanning(
    const astro::DateTime& start, f64 duration_hours, f64 step_seconds)
{
    auto start_jd = astro::TimeSystem::to_julian_date(start);
    if (!start_jd)
    {
        return core::make_error(start_jd.error().code, "window start: " + start_jd.error().message);
    }

    const ObservationWindow window{
        .start_jd     = *start_jd,
        .end_jd       = *start_jd + duration_hours / 24.0,
        .step_seconds = step_seconds,
    };

    if (auto error = window.validate())
    {
        return *error;
    }
    return window;
}

std::optional<core::Error> ObservationWindow::validate() const
{
    if (!std::isfinite(start_jd) || !std::isfinite(end_jd) || !std::isfinite(step_seconds))
    {
        return core::make_error(core::ErrorCode::InvalidWindow,
                                "window start, end and step must be finite");
    }
    if (step_seconds <= 0.0)
    {
        return core::make_error(core::ErrorCode::InvalidWindow,
            fmt::format("step {} s is not positive", step_seconds));
    }
    if (end_jd <= start_jd)
    {
        return core::make_error(core::ErrorCode::InvalidWindow,
            fmt::format("window end (JD {:.6f}) is not after start (JD {:.6f})", end_jd, start_jd));
    }

    const f64 samples = duration_seconds() / step_seconds;
    if (samples > static_cast<f64>(VisibilityScanner::kMaxSamples - 2))
    {
        return core::make_error(core::ErrorCode::InvalidWindow,
            fmt::format("step {} s over {:.1f} h needs more than {} samples",
                        step_seconds, duration_seconds() / 3600.0, VisibilityScanner::kMaxSamples));
    }

    return std::nullopt;
}

// =================================================================
// VisibilityScanner
// =================================================================

std::optional<core::Error> VisibilityScanner::validate_threshold(f64 threshold_deg)
{
    if (!std::isfinite(threshold_deg) || threshold_deg < -90.0 || threshold_deg > 90.0)
    {
        return core::make_error(core::ErrorCode::InvalidThreshold,
            fmt::format("minimum elevation {} deg outside [-90, 90]", threshold_deg));
    }
    return std::nullopt;
}

std::optional<core::Error> VisibilityScanner::validate_options(const ScanOptions& options)
{
    if (!std::isfinite(options.elevation_offset_deg) || std::abs(options.elevation_offset_deg) > 90.0)
    {
        return core::make_error(core::ErrorCode::InvalidThreshold,
            fmt::format("elevation offset {} deg outside [-90, 90]", options.elevation_offset_deg));
    }
    return std::nullopt;
}

std::optional<core::Error> VisibilityScanner::validate_station(const catalog::Station& station)
{
    const astro::ObserverLocation observer{
        .latitude_rad  = station.latitude_deg * astro_constants::kDegToRad,
        .longitude_rad = station.longitude_deg * astro_constants::kDegToRad,
    };

    if (auto error = astro::Coordinates::validate_observer(observer))
    {
        return core::make_error(error->code,
                                fmt::format("station '{}': {}", station.id, error->message));
    }
    return std::nullopt;
}

std::optional<core::Error> VisibilityScanner::validate_source(const catalog::Source& source)
{
    const astro::EquatorialCoord eq{
        .ra  = source.ra_deg * astro_constants::kDegToRad,
        .dec = source.dec_deg * astro_constants::kDegToRad,
    };

    if (auto error = astro::Coordinates::validate_equatorial(eq))
    {
        return core::make_error(error->code,
                                fmt::format("source '{}': {}", source.id, error->message));
    }
    return std::nullopt;
}

core::Result<VisibilityScan> VisibilityScanner::scan(
    const catalog::Station& station,
    const catalog::Source& source,
    const ObservationWindow& window,
    f64 threshold_deg,
    const ScanOptions& options)
{
    if (auto error = window.validate())
    {
        return *error;
    }
    if (auto error = validate_threshold(threshold_deg))
    {
        return *error;
    }
    if (auto error = validate_options(options))
    {
        return *error;
    }
    if (auto error = validate_station(station))
    {
        return *error;
    }
    if (auto error = validate_source(source))
    {
        return *error;
    }

    return VisibilityScan(station, source, window, threshold_deg, options);
}

// =================================================================
// VisibilityScan
// =================================================================

VisibilityScan::VisibilityScan(catalog::Station station, catalog::Source source,
                               const ObservationWindow& window, f64 threshold_deg,
                               const ScanOptions& options)
    : m_station(std::move(station))
    , m_source(std::move(source))
    , m_window(window)
    , m_threshold_deg(threshold_deg)
    , m_options(options)
    , m_equatorial{
          .ra  = astro::Coordinates::normalize_radians(m_source.ra_deg * astro_constants::kDegToRad),
          .dec = m_source.dec_deg * astro_constants::kDegToRad,
      }
    , m_observer{
          .latitude_rad  = m_station.latitude_deg * astro_constants::kDegToRad,
          .longitude_rad = m_station.longitude_deg * astro_constants::kDegToRad,
      }
    , m_sample_count(compute_sample_count(window))
{
}

f64 VisibilityScan::sample_time(i64 index) const
{
    if (index <= 0)
    {
        return m_window.start_jd;
    }
    if (index >= m_sample_count - 1)
    {
        return m_window.end_jd;
    }

    // Offsets are computed from the start each time, never accumulated
    return m_window.start_jd
         + static_cast<f64>(index) * m_window.step_seconds / astro_constants::kSecondsPerDay;
}

ElevationSample VisibilityScan::evaluate(f64 jd) const
{
    const f64 lst = astro::TimeSystem::lmst(jd, m_observer.longitude_rad);
    const astro::HorizontalCoord hz =
        astro::Coordinates::equatorial_to_horizontal(m_equatorial, m_observer, lst);

    const f64 elevation = std::clamp(hz.alt * astro_constants::kRadToDeg + m_options.elevation_offset_deg,
                                     -90.0, 90.0);

    f64 azimuth = hz.az * astro_constants::kRadToDeg;
    if (azimuth >= 360.0)
    {
        azimuth = 0.0;
    }

    f64 lst_hours = lst * astro_constants::kRadToHour;
    if (lst_hours >= 24.0)
    {
        lst_hours = 0.0;
    }

    return ElevationSample{
        .jd            = jd,
        .lst_hours     = lst_hours,
        .azimuth_deg   = azimuth,
        .elevation_deg = elevation,
    };
}

std::vector<VisibilityInterval> VisibilityScan::collect() const
{
    std::vector<VisibilityInterval> intervals;
    for (const VisibilityInterval& interval : *this)
    {
        intervals.push_back(interval);
    }
    return intervals;
}

std::vector<ElevationSample> VisibilityScan::samples() const
{
    std::vector<ElevationSample> curve;
    curve.reserve(static_cast<std::size_t>(m_sample_count));
    for (i64 i = 0; i < m_sample_count; ++i)
    {
        curve.push_back(evaluate(sample_time(i)));
    }
    return curve;
}

// =================================================================
// Crossing detector
//
// BELOW --(sample > threshold)--> ABOVE: open at the interpolated rise
// ABOVE --(sample <= threshold)--> BELOW: close at the interpolated set, emit
//
// First sample ABOVE: open at window start (rise_clipped).
// Last sample ABOVE: close at window end (set_clipped).
// =================================================================

VisibilityScan::Iterator::Iterator(const VisibilityScan* scan, std::stop_token stop)
    : m_scan(scan)
    , m_stop(std::move(stop))
    , m_done(false)
{
    advance();
}

void VisibilityScan::Iterator::advance()
{
    const f64 threshold = m_scan->m_threshold_deg;

    while (m_next_index < m_scan->m_sample_count)
    {
        if (m_next_index % kStopPollSamples == 0 && m_stop.stop_requested())
        {
            m_done = true;
            return;
        }

        const ElevationSample sample = m_scan->evaluate(m_scan->sample_time(m_next_index));
        const bool above = sample.elevation_deg > threshold;

        if (m_next_index == 0)
        {
            if (above)
            {
                open_interval(sample.jd, true, sample);
            }
            m_state = above ? State::Above : State::Below;
        }
        else if (m_state == State::Below && above)
        {
            open_interval(crossing_time(m_previous, sample), false, sample);
            m_state = State::Above;
        }
        else if (m_state == State::Above && above)
        {
            if (sample.elevation_deg > m_open.peak_elevation_deg)
            {
                m_open.peak_elevation_deg = sample.elevation_deg;
                m_open.peak_jd = sample.jd;
            }
        }
        else if (m_state == State::Above)
        {
            m_open.end_jd = crossing_time(m_previous, sample);
            m_open.set_clipped = false;
            m_state = State::Below;

            m_previous = sample;
            ++m_next_index;
            m_current = std::move(m_open);
            return;
        }

        m_previous = sample;
        ++m_next_index;
    }

    if (m_state == State::Above)
    {
        m_open.end_jd = m_scan->m_window.end_jd;
        m_open.set_clipped = true;
        m_state = State::Below;
        m_current = std::move(m_open);
        return;
    }

    m_done = true;
}

void VisibilityScan::Iterator::open_interval(f64 start_jd, bool clipped, const ElevationSample& sample)
{
    m_open = VisibilityInterval{
        .station_id         = m_scan->m_station.id,
        .source_id          = m_scan->m_source.id,
        .start_jd           = start_jd,
        .end_jd             = start_jd,
        .peak_elevation_deg = sample.elevation_deg,
        .peak_jd            = sample.jd,
        .rise_clipped       = clipped,
        .set_clipped        = false,
    };
}

// Linear interpolation of the instant the elevation equals the threshold.
// Exactly one of the two samples is above the threshold, so the elevations differ.
f64 VisibilityScan::Iterator::crossing_time(const ElevationSample& before, const ElevationSample& after) const
{
    const f64 fraction = (m_scan->m_threshold_deg - before.elevation_deg)
                       / (after.elevation_deg - before.elevation_deg);
    return before.jd + fraction * (after.jd - before.jd);
}

} // namespace uptime::visibility
