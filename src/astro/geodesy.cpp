/// @file geodesy.cpp
/// @brief WGS84 ECEF ↔ geodetic conversions.

#include "astro/geodesy.hpp"

#include <cmath>

namespace uptime::astro
{

namespace
{

constexpr int kMaxIterations = 10;
constexpr f64 kLatitudeToleranceRad = 1e-14;

/// Distances from the polar axis below this are treated as on the axis.
constexpr f64 kAxisEpsilonM = 1e-9;

f64 prime_vertical_radius(f64 sin_lat)
{
    return Geodesy::kWgs84SemiMajorM
         / std::sqrt(1.0 - Geodesy::kWgs84EccentricitySq * sin_lat * sin_lat);
}

/// h = p cos(lat) + z sin(lat) − a² / N, stable right up to the poles.
f64 ellipsoid_height(f64 p, f64 z, f64 latitude)
{
    const f64 sin_lat = std::sin(latitude);
    const f64 n = prime_vertical_radius(sin_lat);
    return p * std::cos(latitude) + z * sin_lat
         - Geodesy::kWgs84SemiMajorM * Geodesy::kWgs84SemiMajorM / n;
}

} // anonymous namespace

// -----------------------------------------------------------------
// ECEF → geodetic
//
// p   = sqrt(X² + Y²)
// lon = atan2(Y, X)
// lat₀ = atan2(Z, p (1 − e²))
// iterate:
//   N   = a / sqrt(1 − e² sin²lat)
//   h   = p cos(lat) + Z sin(lat) − a² / N
//   lat = atan2(Z, p (1 − e² N / (N + h)))
// -----------------------------------------------------------------

GeodeticCoord Geodesy::geocentric_to_geodetic(const Vec3d& ecef_m)
{
    const f64 x = ecef_m.x;
    const f64 y = ecef_m.y;
    const f64 z = ecef_m.z;

    const f64 p = std::hypot(x, y);

    if (p < kAxisEpsilonM)
    {
        return GeodeticCoord{
            .latitude_rad  = (z >= 0.0) ? astro_constants::kHalfPi : -astro_constants::kHalfPi,
            .longitude_rad = 0.0,
            .height_m      = std::abs(z) - kWgs84SemiMinorM,
        };
    }

    const f64 longitude = std::atan2(y, x);

    f64 latitude = std::atan2(z, p * (1.0 - kWgs84EccentricitySq));
    f64 height = 0.0;

    for (int i = 0; i < kMaxIterations; ++i)
    {
        const f64 n = prime_vertical_radius(std::sin(latitude));
        height = ellipsoid_height(p, z, latitude);

        const f64 next = std::atan2(z, p * (1.0 - kWgs84EccentricitySq * n / (n + height)));
        const bool converged = std::abs(next - latitude) < kLatitudeToleranceRad;
        latitude = next;
        if (converged)
        {
            break;
        }
    }

    height = ellipsoid_height(p, z, latitude);

    return GeodeticCoord{
        .latitude_rad  = latitude,
        .longitude_rad = longitude,
        .height_m      = height,
    };
}

// -----------------------------------------------------------------
// Geodetic → ECEF
// -----------------------------------------------------------------

Vec3d Geodesy::geodetic_to_geocentric(const GeodeticCoord& geo)
{
    const f64 sin_lat = std::sin(geo.latitude_rad);
    const f64 cos_lat = std::cos(geo.latitude_rad);
    const f64 n = prime_vertical_radius(sin_lat);

    return Vec3d{
        (n + geo.height_m) * cos_lat * std::cos(geo.longitude_rad),
        (n + geo.height_m) * cos_lat * std::sin(geo.longitude_rad),
        (n * (1.0 - kWgs84EccentricitySq) + geo.height_m) * sin_lat,
    };
}

} // namespace uptime::astro
