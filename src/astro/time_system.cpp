/// @file time_system.cpp
/// @brief Calendar arithmetic, Julian Dates and mean sidereal time.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cmath>

namespace uptime::astro
{

namespace
{

constexpr i32 kMinYear = 1;
constexpr i32 kMaxYear = 9999;

/// Parse exactly `width` decimal digits starting at `pos`.
std::optional<i32> parse_fixed_int(std::string_view text, std::size_t pos, std::size_t width)
{
    if (pos + width > text.size())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const char* first = text.data() + pos;
    const char* last = first + width;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

core::Error malformed(std::string_view text)
{
    return core::make_error(core::ErrorCode::InvalidCalendarDate,
                            fmt::format("malformed UTC timestamp '{}'", text));
}

} // anonymous namespace

// -----------------------------------------------------------------
// Calendar validation (proleptic Gregorian)
// -----------------------------------------------------------------

bool TimeSystem::is_leap_year(i32 year)
{
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    static constexpr i32 kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12)
    {
        return 0;
    }
    if (month == 2 && is_leap_year(year))
    {
        return 29;
    }
    return kDays[month - 1];
}

std::optional<core::Error> TimeSystem::validate(const DateTime& dt)
{
    const auto invalid = [](std::string message) {
        return core::make_error(core::ErrorCode::InvalidCalendarDate, std::move(message));
    };

    if (dt.year < kMinYear || dt.year > kMaxYear)
    {
        return invalid(fmt::format("year {} outside [{}, {}]", dt.year, kMinYear, kMaxYear));
    }
    if (dt.month < 1 || dt.month > 12)
    {
        return invalid(fmt::format("month {} outside [1, 12]", dt.month));
    }

    const i32 max_day = days_in_month(dt.year, dt.month);
    if (dt.day < 1 || dt.day > max_day)
    {
        return invalid(fmt::format("day {} outside [1, {}] for {:04}-{:02}",
                                   dt.day, max_day, dt.year, dt.month));
    }
    if (dt.hour < 0 || dt.hour > 23)
    {
        return invalid(fmt::format("hour {} outside [0, 23]", dt.hour));
    }
    if (dt.minute < 0 || dt.minute > 59)
    {
        return invalid(fmt::format("minute {} outside [0, 59]", dt.minute));
    }
    if (!std::isfinite(dt.second) || dt.second < 0.0 || dt.second >= 60.0)
    {
        return invalid(fmt::format("second {} outside [0, 60)", dt.second));
    }

    return std::nullopt;
}

// -----------------------------------------------------------------
// Civil day count
//
// Days are counted from 1970-01-01 in 400-year eras of 146097 days,
// with the year starting on March 1 so the leap day falls last.
// Every date is treated as proleptic Gregorian.
// -----------------------------------------------------------------

namespace
{

constexpr i64 kUnixEpochDayNumber = 2440588;   // JD of 1970-01-01 12:00
constexpr f64 kUnixEpochJd = 2440587.5;        // JD of 1970-01-01 00:00

i64 days_from_civil(i64 year, i64 month, i64 day)
{
    year -= (month <= 2) ? 1 : 0;
    const i64 era = (year >= 0 ? year : year - 399) / 400;
    const i64 year_of_era = year - era * 400;
    const i64 day_of_year = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const i64 day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + day_of_era - 719468;
}

struct CivilDay
{
    i32 year;
    i32 month;
    i32 day;
};

CivilDay civil_from_days(i64 days)
{
    days += 719468;
    const i64 era = (days >= 0 ? days : days - 146096) / 146097;
    const i64 day_of_era = days - era * 146097;
    const i64 year_of_era =
        (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
    const i64 day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
    const i64 shifted_month = (5 * day_of_year + 2) / 153;

    const i64 day = day_of_year - (153 * shifted_month + 2) / 5 + 1;
    const i64 month = (shifted_month < 10) ? shifted_month + 3 : shifted_month - 9;
    const i64 year = year_of_era + era * 400 + ((month <= 2) ? 1 : 0);

    return CivilDay{static_cast<i32>(year), static_cast<i32>(month), static_cast<i32>(day)};
}

} // anonymous namespace

core::Result<f64> TimeSystem::to_julian_date(const DateTime& dt)
{
    if (auto error = validate(dt))
    {
        return *error;
    }

    const f64 seconds_of_day = static_cast<f64>(dt.hour * 3600 + dt.minute * 60) + dt.second;
    const i64 days = days_from_civil(dt.year, dt.month, dt.day);

    return kUnixEpochJd + static_cast<f64>(days) + seconds_of_day / astro_constants::kSecondsPerDay;
}

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Civil days begin at midnight, half a day before the Julian day number
    const f64 midnight_based = jd + 0.5;
    const f64 day_number = std::floor(midnight_based);
    const CivilDay date = civil_from_days(static_cast<i64>(day_number) - kUnixEpochDayNumber);

    const f64 seconds = (midnight_based - day_number) * astro_constants::kSecondsPerDay;
    const i32 hour = static_cast<i32>(seconds / 3600.0);
    const i32 minute = static_cast<i32>((seconds - hour * 3600.0) / 60.0);

    return DateTime{
        .year   = date.year,
        .month  = date.month,
        .day    = date.day,
        .hour   = hour,
        .minute = minute,
        .second = seconds - hour * 3600.0 - minute * 60.0,
    };
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// Greenwich mean sidereal time, IAU 1982 expression in degrees:
//   280.46061837 + 360.98564736629 d + T^2 (0.000387933 - T / 38710000)
// with d days and T Julian centuries from J2000.0.
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 days = jd - astro_constants::kJ2000;

    const f64 degrees = 280.46061837 + 360.98564736629 * days
                      + t * t * (0.000387933 - t / 38710000.0);

    return normalize_radians(degrees * astro_constants::kDegToRad);
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

f64 TimeSystem::local_sidereal_hours(f64 jd, f64 longitude_deg)
{
    const f64 hours = lmst(jd, longitude_deg * astro_constants::kDegToRad)
                    * astro_constants::kRadToHour;

    // Rounding in the radian→hour conversion can land exactly on 24.0
    return (hours >= 24.0) ? 0.0 : hours;
}

// -----------------------------------------------------------------
// ISO-8601 parsing: YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z]
// -----------------------------------------------------------------

core::Result<DateTime> TimeSystem::parse_utc(std::string_view text)
{
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
    {
        text.remove_suffix(1);
    }

    if (text.size() < 10 || text[4] != '-' || text[7] != '-')
    {
        return malformed(text);
    }

    const auto year  = parse_fixed_int(text, 0, 4);
    const auto month = parse_fixed_int(text, 5, 2);
    const auto day   = parse_fixed_int(text, 8, 2);
    if (!year || !month || !day)
    {
        return malformed(text);
    }

    DateTime dt{
        .year   = *year,
        .month  = *month,
        .day    = *day,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    if (text.size() > 10)
    {
        if ((text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
            text.size() < 16 || text[13] != ':')
        {
            return malformed(text);
        }

        const auto hour   = parse_fixed_int(text, 11, 2);
        const auto minute = parse_fixed_int(text, 14, 2);
        if (!hour || !minute)
        {
            return malformed(text);
        }
        dt.hour = *hour;
        dt.minute = *minute;

        if (text.size() > 16)
        {
            if (text[16] != ':' || text.size() < 19)
            {
                return malformed(text);
            }

            f64 second = 0.0;
            const char* first = text.data() + 17;
            const char* last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, second);
            if (ec != std::errc{} || ptr != last)
            {
                return malformed(text);
            }
            dt.second = second;
        }
    }

    if (auto error = validate(dt))
    {
        return *error;
    }
    return dt;
}

// -----------------------------------------------------------------
// Julian Date → "YYYY-MM-DDTHH:MM:SSZ"
//
// Rounding happens on whole seconds of the civil day, so the day
// rolls over cleanly instead of printing 23:59:60.
// -----------------------------------------------------------------

std::string TimeSystem::format_utc(f64 jd)
{
    const f64 shifted = jd + 0.5;
    f64 day_number = std::floor(shifted);
    i64 seconds = std::llround((shifted - day_number) * astro_constants::kSecondsPerDay);
    if (seconds >= 86400)
    {
        day_number += 1.0;
        seconds -= 86400;
    }

    const DateTime date = from_julian_date(day_number - 0.5);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
                       date.year, date.month, date.day,
                       seconds / 3600, (seconds / 60) % 60, seconds % 60);
}

f64 TimeSystem::now_as_jd()
{
    const auto elapsed = std::chrono::system_clock::now().time_since_epoch();
    const f64 seconds = std::chrono::duration<f64>(elapsed).count();
    return kUnixEpochJd + seconds / astro_constants::kSecondsPerDay;
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    const f64 wrapped = angle - astro_constants::kTwoPi * std::floor(angle / astro_constants::kTwoPi);
    return (wrapped >= astro_constants::kTwoPi) ? 0.0 : wrapped;
}

} // namespace uptime::astro
