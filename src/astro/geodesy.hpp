#pragma once

/// @file geodesy.hpp
/// @brief WGS84 conversions between Earth-centred (ECEF) and geodetic positions.

#include "core/types.hpp"

namespace uptime::astro
{
    /// @brief Geodetic position on the WGS84 ellipsoid.
    struct GeodeticCoord
    {
        f64 latitude_rad;   ///< Geodetic latitude (radians, north positive)
        f64 longitude_rad;  ///< Longitude (radians, east positive, -π..π)
        f64 height_m;       ///< Height above the ellipsoid (meters)
    };

    /// @brief Static utility class for antenna position conversions.
    ///
    /// VLBI station catalogs give antenna reference points as ECEF X/Y/Z in
    /// meters; the horizontal transform needs geodetic latitude and longitude.
    class Geodesy
    {
    public:
        Geodesy() = delete;

        static constexpr f64 kWgs84SemiMajorM  = 6378137.0;
        static constexpr f64 kWgs84Flattening  = 1.0 / 298.257223563;
        static constexpr f64 kWgs84SemiMinorM  = kWgs84SemiMajorM * (1.0 - kWgs84Flattening);
        static constexpr f64 kWgs84EccentricitySq = kWgs84Flattening * (2.0 - kWgs84Flattening);

        /// @brief ECEF (meters) → geodetic latitude/longitude/height.
        ///
        /// Iterative solution (Bowring's starting value), converges to well
        /// below a millimetre for terrestrial positions. Points on the polar
        /// axis return latitude ±π/2 and longitude 0.
        [[nodiscard]] static GeodeticCoord geocentric_to_geodetic(const Vec3d& ecef_m);

        /// @brief Geodetic latitude/longitude/height → ECEF (meters).
        [[nodiscard]] static Vec3d geodetic_to_geocentric(const GeodeticCoord& geo);
    };

} // namespace uptime::astro
