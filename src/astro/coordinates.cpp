/// @file coordinates.cpp
/// @brief Equatorial to horizontal transform and angle wrapping.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <glm/geometric.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace uptime::astro
{

namespace
{

/// Latitudes within this distance of ±π/2 are treated as a pole.
constexpr f64 kPoleEpsilonRad = 1e-12;

/// Slack for degree→radian rounding at the edges of each domain.
constexpr f64 kDomainEpsilonRad = 1e-12;

} // anonymous namespace

// -----------------------------------------------------------------
// Input domain checks
// -----------------------------------------------------------------

std::optional<core::Error> Coordinates::validate_equatorial(const EquatorialCoord& eq)
{
    using astro_constants::kRadToDeg;

    if (!std::isfinite(eq.ra) || eq.ra < -kDomainEpsilonRad ||
        eq.ra > astro_constants::kTwoPi + kDomainEpsilonRad)
    {
        return core::make_error(core::ErrorCode::InvalidCoordinate,
            fmt::format("right ascension {} deg outside [0, 360]", eq.ra * kRadToDeg));
    }
    if (!std::isfinite(eq.dec) || std::abs(eq.dec) > astro_constants::kHalfPi + kDomainEpsilonRad)
    {
        return core::make_error(core::ErrorCode::InvalidCoordinate,
            fmt::format("declination {} deg outside [-90, 90]", eq.dec * kRadToDeg));
    }
    return std::nullopt;
}

std::optional<core::Error> Coordinates::validate_observer(const ObserverLocation& observer)
{
    using astro_constants::kRadToDeg;

    if (!std::isfinite(observer.latitude_rad) ||
        std::abs(observer.latitude_rad) > astro_constants::kHalfPi + kDomainEpsilonRad)
    {
        return core::make_error(core::ErrorCode::InvalidCoordinate,
            fmt::format("latitude {} deg outside [-90, 90]", observer.latitude_rad * kRadToDeg));
    }
    if (!std::isfinite(observer.longitude_rad) ||
        observer.longitude_rad < -astro_constants::kPi - kDomainEpsilonRad ||
        observer.longitude_rad > astro_constants::kTwoPi + kDomainEpsilonRad)
    {
        return core::make_error(core::ErrorCode::InvalidCoordinate,
            fmt::format("longitude {} deg outside [-180, 360]", observer.longitude_rad * kRadToDeg));
    }
    return std::nullopt;
}

f64 Coordinates::hour_angle(f64 local_sidereal_time_rad, f64 ra_rad)
{
    return wrap_pi(local_sidereal_time_rad - ra_rad);
}

// -----------------------------------------------------------------
// Horizon transform
//
// The source direction is first written in the hour-angle frame
// (x toward the local meridian on the equator, y toward H = 90 deg,
// z toward the celestial pole), then projected on the local up,
// north and east axes. Azimuth runs from north through east.
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 ha = hour_angle(local_sidereal_time_rad, eq.ra);
    const f64 cos_dec = std::cos(eq.dec);

    const Vec3d direction{cos_dec * std::cos(ha), cos_dec * std::sin(ha), std::sin(eq.dec)};

    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const Vec3d up_axis{cos_lat, 0.0, sin_lat};
    const Vec3d north_axis{-sin_lat, 0.0, cos_lat};
    const Vec3d east_axis{0.0, -1.0, 0.0};

    const f64 alt = std::asin(std::clamp(glm::dot(direction, up_axis), -1.0, 1.0));

    // Azimuth is undefined at a pole; report north
    if (astro_constants::kHalfPi - std::abs(observer.latitude_rad) <= kPoleEpsilonRad)
    {
        return HorizontalCoord{.alt = alt, .az = 0.0};
    }

    const f64 az = std::atan2(glm::dot(direction, east_axis), glm::dot(direction, north_axis));
    return HorizontalCoord{.alt = alt, .az = normalize_radians(az)};
}

f64 Coordinates::normalize_radians(f64 angle)
{
    const f64 wrapped = angle - astro_constants::kTwoPi * std::floor(angle / astro_constants::kTwoPi);
    return (wrapped >= astro_constants::kTwoPi) ? 0.0 : wrapped;
}

f64 Coordinates::wrap_pi(f64 angle)
{
    const f64 wrapped = normalize_radians(angle + astro_constants::kPi) - astro_constants::kPi;
    return (wrapped >= astro_constants::kPi) ? wrapped - astro_constants::kTwoPi : wrapped;
}

} // namespace uptime::astro
