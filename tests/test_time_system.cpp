/// @file test_time_system.cpp
/// @brief Unit tests for uptime::astro::TimeSystem.
///
/// Verifies calendar validation, Julian Date conversion,
/// GMST (IAU 1982), LMST, and ISO-8601 parsing/formatting against known
/// reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace uptime;
using namespace uptime::astro;

// =================================================================
// Tolerances
// =================================================================

static constexpr f64 kJdTolerance     = 1e-9;   // Relative; ~0.2 s at JD 2.4e6
static constexpr f64 kAngleTolDeg     = 0.01;   // Degrees
static constexpr f64 kSecondTolerance = 1e-3;   // Seconds (round-trip)

namespace
{

f64 jd_of(const DateTime& dt)
{
    const auto jd = TimeSystem::to_julian_date(dt);
    REQUIRE(jd.has_value());
    return *jd;
}

} // anonymous namespace

// =================================================================
// Julian Date conversion
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const DateTime j2000 = {
        .year   = 2000,
        .month  = 1,
        .day    = 1,
        .hour   = 12,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(jd_of(j2000) == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC → JD 2451179.5")
{
    const DateTime dt = {
        .year   = 1999,
        .month  = 1,
        .day    = 1,
        .hour   = 0,
        .minute = 0,
        .second = 0.0,
    };

    CHECK(jd_of(dt) == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC")
{
    const DateTime dt = {
        .year   = 2024,
        .month  = 6,
        .day    = 15,
        .hour   = 22,
        .minute = 30,
        .second = 0.0,
    };

    CHECK(jd_of(dt) == doctest::Approx(2460476.4375).epsilon(kJdTolerance));
}

TEST_CASE("Leap day 2000-02-29 is accepted")
{
    const DateTime dt = {.year = 2000, .month = 2, .day = 29, .hour = 0, .minute = 0, .second = 0.0};
    CHECK(jd_of(dt) == doctest::Approx(2451603.5).epsilon(kJdTolerance));
}

TEST_CASE("Dates before 1582 use the proleptic Gregorian calendar")
{
    // Proleptic Gregorian 1582-10-04 is eleven days before the reform date 1582-10-15
    const DateTime before_reform = {.year = 1582, .month = 10, .day = 4, .hour = 0, .minute = 0, .second = 0.0};
    CHECK(jd_of(before_reform) == doctest::Approx(2299149.5).epsilon(kJdTolerance));

    const DateTime year_one = {.year = 1, .month = 1, .day = 1, .hour = 0, .minute = 0, .second = 0.0};
    CHECK(jd_of(year_one) == doctest::Approx(1721425.5).epsilon(kJdTolerance));
}

TEST_CASE("Last supported day 9999-12-31")
{
    const DateTime dt = {.year = 9999, .month = 12, .day = 31, .hour = 0, .minute = 0, .second = 0.0};
    CHECK(jd_of(dt) == doctest::Approx(5373483.5).epsilon(kJdTolerance));
}

// =================================================================
// Calendar validation
// =================================================================

TEST_CASE("Invalid calendar fields are rejected with InvalidCalendarDate")
{
    const DateTime base = {.year = 2023, .month = 6, .day = 15, .hour = 12, .minute = 0, .second = 0.0};

    SUBCASE("February 29 of a non-leap year")
    {
        DateTime dt = base;
        dt.month = 2;
        dt.day = 29;
        const auto jd = TimeSystem::to_julian_date(dt);
        REQUIRE_FALSE(jd.has_value());
        CHECK(jd.error().code == core::ErrorCode::InvalidCalendarDate);
    }

    SUBCASE("Month 13")
    {
        DateTime dt = base;
        dt.month = 13;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
    }

    SUBCASE("Hour 24")
    {
        DateTime dt = base;
        dt.hour = 24;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
    }

    SUBCASE("Minute 60")
    {
        DateTime dt = base;
        dt.minute = 60;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
    }

    SUBCASE("Second 60")
    {
        DateTime dt = base;
        dt.second = 60.0;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
    }

    SUBCASE("Year 0 and year 10000")
    {
        DateTime dt = base;
        dt.year = 0;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
        dt.year = 10000;
        CHECK_FALSE(TimeSystem::to_julian_date(dt).has_value());
    }

    SUBCASE("April 31")
    {
        DateTime dt = base;
        dt.month = 4;
        dt.day = 31;
        const auto error = TimeSystem::validate(dt);
        REQUIRE(error.has_value());
        CHECK(error->message.find("day") != std::string::npos);
    }
}

TEST_CASE("Leap year rules")
{
    CHECK(TimeSystem::is_leap_year(2024));
    CHECK(TimeSystem::is_leap_year(2000));
    CHECK_FALSE(TimeSystem::is_leap_year(1900));
    CHECK_FALSE(TimeSystem::is_leap_year(2023));

    CHECK(TimeSystem::days_in_month(2024, 2) == 29);
    CHECK(TimeSystem::days_in_month(2023, 2) == 28);
    CHECK(TimeSystem::days_in_month(2023, 12) == 31);
}

// =================================================================
// Round-trip: DateTime → JD → DateTime
// =================================================================

TEST_CASE("Round-trip: DateTime → JD → DateTime preserves values")
{
    const DateTime original = {
        .year   = 2024,
        .month  = 3,
        .day    = 15,
        .hour   = 14,
        .minute = 30,
        .second = 45.0,
    };

    const DateTime result = TimeSystem::from_julian_date(jd_of(original));

    CHECK(result.year   == original.year);
    CHECK(result.month  == original.month);
    CHECK(result.day    == original.day);
    CHECK(result.hour   == original.hour);
    CHECK(result.minute == original.minute);
    CHECK(std::abs(result.second - original.second) < kSecondTolerance);
}

TEST_CASE("Round-trip: proleptic date before the Gregorian reform")
{
    const DateTime original = {.year = 1000, .month = 7, .day = 4, .hour = 6, .minute = 0, .second = 0.0};

    const DateTime result = TimeSystem::from_julian_date(jd_of(original));

    CHECK(result.year  == 1000);
    CHECK(result.month == 7);
    CHECK(result.day   == 4);
    CHECK(result.hour  == 6);
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000.0 is 0.0")
{
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == doctest::Approx(0.0));
}

TEST_CASE("Julian centuries at J2100.0")
{
    const DateTime dt = {.year = 2100, .month = 1, .day = 1, .hour = 12, .minute = 0, .second = 0.0};
    CHECK(TimeSystem::julian_centuries(jd_of(dt)) == doctest::Approx(1.0).epsilon(0.001));
}

// =================================================================
// GMST
// =================================================================

TEST_CASE("GMST at J2000.0 ≈ 280.46°")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(gmst_deg == doctest::Approx(280.46061837).epsilon(1e-6));
}

TEST_CASE("GMST at 2024-01-01 00:00 UTC ≈ 6h 40m 36.6s")
{
    const f64 jd = 2460310.5;
    const f64 gmst_hours = TimeSystem::gmst(jd) * astro_constants::kRadToHour;
    CHECK(gmst_hours == doctest::Approx(6.676842).epsilon(1e-6));
}

TEST_CASE("GMST is in range [0, 2π)")
{
    const f64 dates[] = {
        2451545.0,   // J2000.0
        2460000.0,   // ~2023
        2460476.0,   // ~2024-06
        2440587.5,   // Unix epoch
        1721425.5,   // 0001-01-01
    };

    for (const f64 jd : dates)
    {
        const f64 gmst_rad = TimeSystem::gmst(jd);
        CHECK(gmst_rad >= 0.0);
        CHECK(gmst_rad < astro_constants::kTwoPi);
    }
}

TEST_CASE("GMST advances one sidereal day faster than the solar day")
{
    // 24 solar hours later the sky has turned ~3m 56s further
    const f64 jd = 2460310.5;
    f64 delta_deg = (TimeSystem::gmst(jd + 1.0) - TimeSystem::gmst(jd)) * astro_constants::kRadToDeg;
    if (delta_deg < 0.0)
    {
        delta_deg += 360.0;
    }
    CHECK(delta_deg == doctest::Approx(0.98564736629).epsilon(1e-6));
}

// =================================================================
// LMST
// =================================================================

TEST_CASE("LMST at Greenwich (longitude 0) equals GMST")
{
    const f64 jd = astro_constants::kJ2000;
    CHECK(TimeSystem::lmst(jd, 0.0) == doctest::Approx(TimeSystem::gmst(jd)).epsilon(1e-12));
}

TEST_CASE("LMST shifts east by longitude")
{
    const f64 jd = astro_constants::kJ2000;
    const f64 lon = 15.0 * astro_constants::kDegToRad;  // 15° East = 1 hour

    f64 expected = std::fmod(TimeSystem::gmst(jd) + lon, astro_constants::kTwoPi);
    if (expected < 0.0)
    {
        expected += astro_constants::kTwoPi;
    }

    CHECK(TimeSystem::lmst(jd, lon) == doctest::Approx(expected).epsilon(1e-10));
}

TEST_CASE("LMST is in range [0, 2π) for western longitudes")
{
    const f64 lmst_val = TimeSystem::lmst(2460000.0, -104.02 * astro_constants::kDegToRad);
    CHECK(lmst_val >= 0.0);
    CHECK(lmst_val < astro_constants::kTwoPi);
}

TEST_CASE("Local sidereal hours at 138°E on 2024-01-01 00:00 UTC")
{
    const f64 hours = TimeSystem::local_sidereal_hours(2460310.5, 138.0);
    CHECK(hours == doctest::Approx(15.876842).epsilon(1e-6));
    CHECK(hours >= 0.0);
    CHECK(hours < 24.0);
}

// =================================================================
// ISO-8601 parsing and formatting
// =================================================================

TEST_CASE("parse_utc accepts the supported forms")
{
    SUBCASE("Date only")
    {
        const auto dt = TimeSystem::parse_utc("2024-01-01");
        REQUIRE(dt.has_value());
        CHECK(dt->year == 2024);
        CHECK(dt->hour == 0);
    }

    SUBCASE("Hours and minutes with Z")
    {
        const auto dt = TimeSystem::parse_utc("2024-06-15T22:30Z");
        REQUIRE(dt.has_value());
        CHECK(dt->hour == 22);
        CHECK(dt->minute == 30);
        CHECK(dt->second == 0.0);
    }

    SUBCASE("Fractional seconds, space separator")
    {
        const auto dt = TimeSystem::parse_utc("1957-10-04 19:28:34.5");
        REQUIRE(dt.has_value());
        CHECK(dt->day == 4);
        CHECK(dt->second == doctest::Approx(34.5));
    }
}

TEST_CASE("parse_utc rejects malformed and invalid timestamps")
{
    CHECK_FALSE(TimeSystem::parse_utc("").has_value());
    CHECK_FALSE(TimeSystem::parse_utc("2024/01/01").has_value());
    CHECK_FALSE(TimeSystem::parse_utc("2024-01-01T12").has_value());
    CHECK_FALSE(TimeSystem::parse_utc("2024-01-01T12:00:xx").has_value());

    const auto bad_day = TimeSystem::parse_utc("2023-02-29T00:00:00Z");
    REQUIRE_FALSE(bad_day.has_value());
    CHECK(bad_day.error().code == core::ErrorCode::InvalidCalendarDate);
}

TEST_CASE("format_utc rounds to the second and rolls the day over")
{
    CHECK(TimeSystem::format_utc(2460310.5) == "2024-01-01T00:00:00Z");
    CHECK(TimeSystem::format_utc(astro_constants::kJ2000) == "2000-01-01T12:00:00Z");

    // 0.4 s before midnight rounds up into the next day
    const f64 almost_midnight = 2460310.5 - 0.4 / astro_constants::kSecondsPerDay;
    CHECK(TimeSystem::format_utc(almost_midnight) == "2024-01-01T00:00:00Z");
}

// =================================================================
// now_as_jd sanity check
// =================================================================

TEST_CASE("now_as_jd returns a reasonable Julian Date")
{
    const f64 jd = TimeSystem::now_as_jd();

    // After 2020-01-01 and before 2100
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
