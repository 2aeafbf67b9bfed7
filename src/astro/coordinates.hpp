#pragma once

/// @file coordinates.hpp
/// @brief Astronomical coordinate transforms: Ecliptic, Equatorial, Horizontal.

#include "core/types.hpp"

namespace slantcol::astro
{
    /// @brief Equatorial coordinate (apparent, of date).
    struct EquatorialCoord
    {
        f64 ra;     ///< Right ascension (radians, 0..2π)
        f64 dec;    ///< Declination (radians, -π/2..+π/2)
    };

    /// @brief Horizontal (topocentric) coordinate.
    struct HorizontalCoord
    {
        f64 alt;    ///< Altitude (radians, -π/2..+π/2, negative = below horizon)
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
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Ecliptic (λ, β) → Equatorial (RA/Dec).
        /// @param lambda Ecliptic longitude (radians).
        /// @param beta Ecliptic latitude (radians).
        /// @param obliquity Obliquity of the ecliptic (radians).
        [[nodiscard]] static EquatorialCoord ecliptic_to_equatorial(f64 lambda, f64 beta, f64 obliquity);

        /// @brief Equatorial (RA/Dec) → Horizontal (Alt/Az).
        /// @param eq Equatorial coordinates of the object.
        /// @param observer Observer geographic location.
        /// @param local_sidereal_time_rad Local sidereal time (radians).
        [[nodiscard]] static HorizontalCoord equatorial_to_horizontal(
            const EquatorialCoord& eq,
            const ObserverLocation& observer,
            f64 local_sidereal_time_rad
        );

        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace slantcol::astro
