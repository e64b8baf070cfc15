/// @file test_coordinates.cpp
/// @brief Unit tests for uptime::astro::Coordinates.
///
/// Verifies the equatorial-to-horizontal transform, azimuth conventions,
/// pole handling and input-domain validation against known reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace uptime;
using namespace uptime::astro;

// =================================================================
// Tolerance constants
// =================================================================

/// 1 arcminute in radians, loose tolerance for approximate checks
static constexpr f64 kArcMinRad = astro_constants::kDegToRad / 60.0;

/// 1 arcsecond in radians, tight tolerance for precision checks
static constexpr f64 kArcSecRad = astro_constants::kArcSecToRad;

/// Degree tolerance for general angular comparisons
static constexpr f64 kDegTol = 0.5 * astro_constants::kDegToRad;

// =================================================================
// Equatorial → Horizontal
// =================================================================

TEST_CASE("Polaris near zenith from North Pole")
{
    const EquatorialCoord polaris = {
        .ra  = 37.954 * astro_constants::kDegToRad,
        .dec = 89.264 * astro_constants::kDegToRad,
    };

    const ObserverLocation north_pole = {
        .latitude_rad  = 90.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };

    // At the pole, altitude = declination for any LST
    for (f64 lst_hours = 0.0; lst_hours < 24.0; lst_hours += 6.0)
    {
        const auto hz = Coordinates::equatorial_to_horizontal(
            polaris, north_pole, lst_hours * astro_constants::kHourToRad);

        CHECK(std::abs(hz.alt - 89.264 * astro_constants::kDegToRad) < kArcSecRad);
        CHECK(hz.az == 0.0);
    }
}

TEST_CASE("South Pole: altitude is minus the declination sign convention")
{
    const ObserverLocation south_pole = {
        .latitude_rad  = -90.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };

    const EquatorialCoord eq = {
        .ra  = 1.0,
        .dec = -30.0 * astro_constants::kDegToRad,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, south_pole, 2.5);
    CHECK(std::abs(hz.alt - 30.0 * astro_constants::kDegToRad) < kArcSecRad);
    CHECK(hz.az == 0.0);
}

TEST_CASE("Star transiting at zenith: RA=LST, Dec=Lat → alt≈90°")
{
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 6.0 * astro_constants::kHourToRad;

    const EquatorialCoord eq = {
        .ra  = lst,   // hour angle = 0
        .dec = lat,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);
    CHECK(std::abs(hz.alt - astro_constants::kHalfPi) < kArcSecRad);
}

TEST_CASE("Equator observer, equator source at transit is at zenith")
{
    const EquatorialCoord eq = {.ra = 0.0, .dec = 0.0};
    const ObserverLocation observer = {.latitude_rad = 0.0, .longitude_rad = 0.0};

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, 0.0);
    CHECK(std::abs(hz.alt - astro_constants::kHalfPi) < kArcSecRad);
}

TEST_CASE("Star on celestial equator due south at transit")
{
    // lat 45°N, Dec 0, HA 0 → alt 45°, az 180°
    const f64 lat = 45.0 * astro_constants::kDegToRad;
    const f64 lst = 3.0 * astro_constants::kHourToRad;

    const EquatorialCoord eq = {
        .ra  = lst,
        .dec = 0.0,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    CHECK(std::abs(hz.alt - 45.0 * astro_constants::kDegToRad) < kArcSecRad);
    CHECK(std::abs(hz.az - astro_constants::kPi) < kDegTol);
}

TEST_CASE("Rising star is in the east, setting star in the west")
{
    const ObserverLocation observer = {
        .latitude_rad  = 35.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };
    const EquatorialCoord eq = {.ra = 0.0, .dec = 0.0};

    // HA = -6h: on the horizon, due east
    const auto rising = Coordinates::equatorial_to_horizontal(eq, observer, -6.0 * astro_constants::kHourToRad);
    CHECK(std::abs(rising.alt) < kArcMinRad);
    CHECK(std::abs(rising.az - astro_constants::kHalfPi) < kDegTol);

    // HA = +6h: on the horizon, due west
    const auto setting = Coordinates::equatorial_to_horizontal(eq, observer, 6.0 * astro_constants::kHourToRad);
    CHECK(std::abs(setting.alt) < kArcMinRad);
    CHECK(std::abs(setting.az - 1.5 * astro_constants::kPi) < kDegTol);
}

TEST_CASE("Star below horizon has negative altitude")
{
    // Dec -60° from lat 45°N at transit: alt = 90° - 105° = -15°
    const f64 lat = 45.0 * astro_constants::kDegToRad;

    const EquatorialCoord eq = {
        .ra  = 0.0,
        .dec = -60.0 * astro_constants::kDegToRad,
    };

    const ObserverLocation observer = {
        .latitude_rad  = lat,
        .longitude_rad = 0.0,
    };

    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, 0.0);

    CHECK(hz.alt < 0.0);
    CHECK(std::abs(hz.alt + 15.0 * astro_constants::kDegToRad) < kArcSecRad);
}

TEST_CASE("Altitude and azimuth stay within range over a grid")
{
    for (f64 lat_deg = -90.0; lat_deg <= 90.0; lat_deg += 30.0)
    {
        const ObserverLocation observer = {
            .latitude_rad  = lat_deg * astro_constants::kDegToRad,
            .longitude_rad = 0.0,
        };

        for (f64 lst_hours = 0.0; lst_hours < 24.0; lst_hours += 5.0)
        {
            for (f64 ra_deg = 0.0; ra_deg < 360.0; ra_deg += 45.0)
            {
                for (f64 dec_deg = -90.0; dec_deg <= 90.0; dec_deg += 30.0)
                {
                    const EquatorialCoord eq = {
                        .ra  = ra_deg * astro_constants::kDegToRad,
                        .dec = dec_deg * astro_constants::kDegToRad,
                    };

                    const auto hz = Coordinates::equatorial_to_horizontal(
                        eq, observer, lst_hours * astro_constants::kHourToRad);

                    CHECK(std::isfinite(hz.alt));
                    CHECK(std::isfinite(hz.az));
                    CHECK(hz.alt >= -astro_constants::kHalfPi);
                    CHECK(hz.alt <=  astro_constants::kHalfPi);
                    CHECK(hz.az  >= 0.0);
                    CHECK(hz.az  <  astro_constants::kTwoPi);
                }
            }
        }
    }
}

// =================================================================
// Hour angle and angle wrapping
// =================================================================

TEST_CASE("Hour angle wraps into [-π, π)")
{
    CHECK(Coordinates::hour_angle(0.1, 0.1) == doctest::Approx(0.0));
    CHECK(Coordinates::hour_angle(0.1, astro_constants::kTwoPi - 0.1) == doctest::Approx(0.2));
    CHECK(Coordinates::hour_angle(astro_constants::kTwoPi - 0.1, 0.1) == doctest::Approx(-0.2));

    const f64 ha = Coordinates::hour_angle(astro_constants::kPi, 0.0);
    CHECK(ha >= -astro_constants::kPi);
    CHECK(ha < astro_constants::kPi);
}

TEST_CASE("normalize_radians maps into [0, 2π)")
{
    CHECK(Coordinates::normalize_radians(-astro_constants::kHalfPi)
          == doctest::Approx(1.5 * astro_constants::kPi));
    CHECK(Coordinates::normalize_radians(5.0 * astro_constants::kPi) == doctest::Approx(astro_constants::kPi));
    CHECK(Coordinates::normalize_radians(astro_constants::kTwoPi) == 0.0);
    CHECK(Coordinates::normalize_radians(-1e-18) < astro_constants::kTwoPi);
}

// =================================================================
// Domain validation
// =================================================================

TEST_CASE("Equatorial coordinates outside their domain are rejected")
{
    const EquatorialCoord ok = {.ra = 1.0, .dec = 0.5};
    CHECK_FALSE(Coordinates::validate_equatorial(ok).has_value());

    const EquatorialCoord dec_too_high = {.ra = 1.0, .dec = 91.0 * astro_constants::kDegToRad};
    const auto error = Coordinates::validate_equatorial(dec_too_high);
    REQUIRE(error.has_value());
    CHECK(error->code == core::ErrorCode::InvalidCoordinate);
    CHECK(error->message.find("declination") != std::string::npos);

    const EquatorialCoord ra_negative = {.ra = -0.5, .dec = 0.0};
    CHECK(Coordinates::validate_equatorial(ra_negative).has_value());

    const EquatorialCoord not_finite = {.ra = std::nan(""), .dec = 0.0};
    CHECK(Coordinates::validate_equatorial(not_finite).has_value());

    // The domain edges themselves are accepted
    const EquatorialCoord edges = {
        .ra  = 360.0 * astro_constants::kDegToRad,
        .dec = -90.0 * astro_constants::kDegToRad,
    };
    CHECK_FALSE(Coordinates::validate_equatorial(edges).has_value());
}

TEST_CASE("Observer locations outside their domain are rejected")
{
    const ObserverLocation pole = {
        .latitude_rad  = 90.0 * astro_constants::kDegToRad,
        .longitude_rad = -180.0 * astro_constants::kDegToRad,
    };
    CHECK_FALSE(Coordinates::validate_observer(pole).has_value());

    const ObserverLocation lat_too_high = {
        .latitude_rad  = 95.0 * astro_constants::kDegToRad,
        .longitude_rad = 0.0,
    };
    const auto error = Coordinates::validate_observer(lat_too_high);
    REQUIRE(error.has_value());
    CHECK(error->message.find("latitude") != std::string::npos);

    const ObserverLocation lon_too_far = {
        .latitude_rad  = 0.0,
        .longitude_rad = 400.0 * astro_constants::kDegToRad,
    };
    CHECK(Coordinates::validate_observer(lon_too_far).has_value());
}

// =================================================================
// Integration: civil time → LST → Alt/Az
// =================================================================

TEST_CASE("Full pipeline: source at RA 180°, Dec 35° from 35°N 138°E on 2024-01-01")
{
    const auto jd = TimeSystem::to_julian_date(
        DateTime{.year = 2024, .month = 1, .day = 1, .hour = 0, .minute = 0, .second = 0.0});
    REQUIRE(jd.has_value());

    const ObserverLocation observer = {
        .latitude_rad  = 35.0 * astro_constants::kDegToRad,
        .longitude_rad = 138.0 * astro_constants::kDegToRad,
    };
    const EquatorialCoord eq = {
        .ra  = 180.0 * astro_constants::kDegToRad,
        .dec = 35.0 * astro_constants::kDegToRad,
    };

    const f64 lst = TimeSystem::lmst(*jd, observer.longitude_rad);
    const auto hz = Coordinates::equatorial_to_horizontal(eq, observer, lst);

    // LST ≈ 15.877h, so HA ≈ 3.877h west of the meridian: alt ≈ 43.1°, western sky
    CHECK(hz.alt * astro_constants::kRadToDeg == doctest::Approx(43.08).epsilon(0.001));
    CHECK(hz.az > astro_constants::kPi);
}
