#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Equatorial → Horizontal.

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>

namespace uptime::astro
{
    /// @brief Equatorial coordinate (J2000 epoch).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude / elevation (radians, -π/2..+π/2, negative = below horizon)
        f64 az;     ///< Azimuth (radians, 0..2π, 0=North, π/2=East)
    };

    /// @brief Observer geographic location.
    struct ObserverLocation
    {
        f64 latitude_rad;   ///< Geodetic latitude (radians, north positive)
        f64 longitude_rad;  ///< Longitude (radians, east positive)
    };

    /// @brief Static utility class for astronomical coordinate transformations.
    ///
    /// All angular inputs and outputs are in radians.
    /// Double precision (f64) is used throughout for arcsecond-level accuracy.
    ///
    /// Azimuth convention: measured from North through East, i.e.
    /// 0 = North, π/2 = East, π = South, 3π/2 = West.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Check an equatorial position before any trigonometry.
        /// @return InvalidCoordinate if RA is outside [0, 2π] or Dec outside
        ///         [-π/2, π/2], or either is not finite.
        [[nodiscard]] static std::optional<core::Error> validate_equatorial(const EquatorialCoord& eq);

        /// @brief Check an observer location before any trigonometry.
        /// @return InvalidCoordinate if latitude is outside [-π/2, π/2], longitude
        ///         outside [-π, 2π], or either is not finite.
        [[nodiscard]] static std::optional<core::Error> validate_observer(const ObserverLocation& observer);

        /// @brief Hour angle H = LST − RA, wrapped into [-π, π).
        /// Positive values are west of the meridian.
        [[nodiscard]] static f64 hour_angle(f64 local_sidereal_time_rad, f64 ra_rad);

        /// @brief Equatorial (RA/Dec J2000) → Horizontal (Alt/Az).
        ///
        /// At the geographic poles azimuth is undefined; it is reported as 0.
        ///
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local Mean Sidereal Time (radians).
        /// @return Horizontal coordinates (altitude and azimuth).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);

        /// @brief Wrap an angle into [-π, π).
        [[nodiscard]] static f64 wrap_pi(f64 angle);
    };

} // namespace uptime::astro
