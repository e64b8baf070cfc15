/// @file catalog_entry.cpp
/// @brief Station factories.

#include "catalog/catalog_entry.hpp"

#include "astro/geodesy.hpp"

#include <cmath>
#include <utility>

namespace uptime::catalog
{

namespace
{

/// Wrap a longitude into (-180, 180].
f64 normalize_longitude(f64 longitude_deg)
{
    f64 lon = std::fmod(longitude_deg, 360.0);
    if (lon > 180.0)
    {
        lon -= 360.0;
    }
    else if (lon <= -180.0)
    {
        lon += 360.0;
    }
    return lon;
}

} // anonymous namespace

Station Station::from_geodetic(std::string id, f64 latitude_deg, f64 longitude_deg, f64 altitude_m)
{
    return Station{
        .id            = std::move(id),
        .latitude_deg  = latitude_deg,
        .longitude_deg = std::isfinite(longitude_deg) ? normalize_longitude(longitude_deg) : longitude_deg,
        .altitude_m    = altitude_m,
    };
}

Station Station::from_geocentric(std::string id, const Vec3d& ecef_m)
{
    const astro::GeodeticCoord geo = astro::Geodesy::geocentric_to_geodetic(ecef_m);

    return from_geodetic(std::move(id),
                         geo.latitude_rad * astro_constants::kRadToDeg,
                         geo.longitude_rad * astro_constants::kRadToDeg,
                         geo.height_m);
}

} // namespace uptime::catalog
