#pragma once

/// @file catalog_entry.hpp
/// @brief Station and source records handed to the visibility engine.

#include "core/types.hpp"

#include <string>

namespace uptime::catalog
{
    /// @brief A ground antenna station.
    ///
    /// Angles are in degrees. Longitude is east positive and normalized to
    /// (-180, 180] by the factories; records built by hand may use 0..360.
    struct Station
    {
        std::string id;         ///< Station name or code (e.g. "YAMAGU32")
        f64 latitude_deg;       ///< Geodetic latitude (-90..90, north positive)
        f64 longitude_deg;      ///< Longitude (east positive)
        f64 altitude_m = 0.0;   ///< Height above the WGS84 ellipsoid

        /// @brief Build a station from geodetic coordinates (degrees, meters).
        [[nodiscard]] static Station from_geodetic(std::string id, f64 latitude_deg,
                                                   f64 longitude_deg, f64 altitude_m = 0.0);

        /// @brief Build a station from a WGS84 ECEF antenna position (meters).
        [[nodiscard]] static Station from_geocentric(std::string id, const Vec3d& ecef_m);
    };

    /// @brief A fixed celestial point source (J2000).
    struct Source
    {
        std::string id;     ///< Source name (e.g. "3C273")
        f64 ra_deg;         ///< Right ascension (decimal degrees, 0..360)
        f64 dec_deg;        ///< Declination (decimal degrees, -90..90)
    };

} // namespace uptime::catalog
