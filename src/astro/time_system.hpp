#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: calendar validation, Julian Date, sidereal time.

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace uptime::astro
{
    /// @brief Civil date/time representation (UTC, proleptic Gregorian calendar).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date conversion (integer civil day count, proleptic Gregorian)
    /// and Greenwich/Local Mean Sidereal Time (IAU 1982).
    ///
    /// Sidereal time is the *mean* sidereal time: nutation (the equation of the
    /// equinoxes, at most ~1.2 s of time) is not applied. That is well below the
    /// pointing-level precision a scheduling tool needs.
    ///
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Check every field of a civil date/time.
        /// @return std::nullopt when valid, otherwise an InvalidCalendarDate error
        ///         naming the offending field.
        [[nodiscard]] static std::optional<core::Error> validate(const DateTime& dt);

        [[nodiscard]] static bool is_leap_year(i32 year);

        /// @brief Number of days in a month (1..12) of the given year.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

        /// @brief Convert civil date/time (UTC) to Julian Date.
        /// @param dt Civil date/time. Year in [1, 9999], month in [1,12],
        ///           day valid for that month.
        /// @return Julian Date, or InvalidCalendarDate.
        [[nodiscard]] static core::Result<f64> to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Date back to civil date/time (UTC).
        /// @param jd Julian Date (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @param jd Julian Date.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @return GMST in radians, normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians).
        /// @param jd Julian Date (UTC).
        /// @param longitude_rad Observer longitude in radians (east positive).
        /// @return LMST in radians, normalized to [0, 2π).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Local Mean Sidereal Time in hours.
        /// @param jd Julian Date (UTC).
        /// @param longitude_deg Observer longitude in degrees (east positive).
        /// @return LMST in hours, wrapped into [0, 24).
        [[nodiscard]] static f64 local_sidereal_hours(f64 jd, f64 longitude_deg);

        /// @brief Parse an ISO-8601 UTC timestamp.
        ///
        /// Accepted forms: "YYYY-MM-DD", "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS",
        /// "YYYY-MM-DDTHH:MM:SS.fff", each optionally followed by 'Z'. A single
        /// space may replace the 'T'.
        [[nodiscard]] static core::Result<DateTime> parse_utc(std::string_view text);

        /// @brief Format a Julian Date as "YYYY-MM-DDTHH:MM:SSZ", rounded to the second.
        [[nodiscard]] static std::string format_utc(f64 jd);

        /// @brief Get current system time as a Julian Date.
        /// @return Julian Date corresponding to the current UTC system clock.
        [[nodiscard]] static f64 now_as_jd();

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace uptime::astro
