#pragma once

/// @file solar_position.hpp
/// @brief Apparent position of the Sun seen from a point on the Earth.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

namespace slantcol::astro
{
    /// @brief Atmospheric conditions used for the refraction correction.
    struct RefractionModel
    {
        bool enabled{true};
        f64  pressure_hpa{1013.25};
        f64  temperature_c{10.0};
    };

    /// @brief Sun direction in degrees, azimuth north-based and clockwise.
    struct SolarAngles
    {
        f64 elevation_deg;  ///< Apparent altitude above the horizon
        f64 azimuth_deg;    ///< 0 = North, 90 = East
    };

    /// @brief Static utility class for the Sun's position.
    ///
    /// Uses the NOAA / Meeus low-precision solar series (good to ~0.01°
    /// between 1950 and 2050) for the apparent ecliptic longitude, then the
    /// equatorial → horizontal transform driven by local mean sidereal time.
    class SolarPosition
    {
    public:
        SolarPosition() = delete;

        /// @brief Apparent right ascension and declination of the Sun.
        /// @param jd Julian Date (UTC).
        [[nodiscard]] static EquatorialCoord apparent_equatorial(f64 jd);

        /// @brief Topocentric horizontal position of the Sun (refraction not applied).
        [[nodiscard]] static HorizontalCoord true_horizontal(const ObserverLocation& observer, f64 jd);

        /// @brief Sun elevation and azimuth in degrees for a geographic site.
        /// @param latitude_deg Geodetic latitude (degrees, north positive).
        /// @param longitude_deg Longitude (degrees, east positive).
        /// @param ts UTC instant.
        /// @param refraction Refraction model applied to the true altitude.
        [[nodiscard]] static SolarAngles angles(f64 latitude_deg,
                                                f64 longitude_deg,
                                                Timestamp ts,
                                                const RefractionModel& refraction = {});

        /// @brief Refraction lift [degrees] for a true altitude [degrees].
        /// Saemundsson (1986), scaled for pressure and temperature. Zero when
        /// the model is disabled or the Sun is more than 1° below the horizon.
        [[nodiscard]] static f64 refraction_deg(f64 true_altitude_deg, const RefractionModel& refraction);
    };

} // namespace slantcol::astro
