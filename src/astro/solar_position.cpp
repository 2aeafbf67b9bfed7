/// @file solar_position.cpp
/// @brief Implementation of the solar position series.

#include "astro/solar_position.hpp"

#include "astro/time_system.hpp"

#include <algorithm>
#include <cmath>

namespace
{

using namespace slantcol;

f64 normalize_degrees(f64 deg)
{
    deg = std::fmod(deg, 360.0);
    return (deg < 0.0) ? deg + 360.0 : deg;
}

f64 sin_deg(f64 deg) { return std::sin(deg * astro_constants::kDegToRad); }
f64 cos_deg(f64 deg) { return std::cos(deg * astro_constants::kDegToRad); }

} // anonymous namespace

namespace slantcol::astro
{

// -----------------------------------------------------------------
// Apparent solar coordinates
//
// L0    = 280.46646 + 36000.76983 T + 0.0003032 T²      (mean longitude)
// M     = 357.52911 + 35999.05029 T − 0.0001537 T²      (mean anomaly)
// C     = equation of centre
// λ_app = L0 + C − 0.00569 − 0.00478 sin Ω               (nutation + aberration)
// ε     = ε0 + 0.00256 cos Ω
// -----------------------------------------------------------------

EquatorialCoord SolarPosition::apparent_equatorial(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);

    const f64 l0 = normalize_degrees(280.46646 + t * (36000.76983 + t * 0.0003032));
    const f64 m  = 357.52911 + t * (35999.05029 - 0.0001537 * t);

    const f64 center = sin_deg(m) * (1.914602 - t * (0.004817 + 0.000014 * t))
                     + sin_deg(2.0 * m) * (0.019993 - 0.000101 * t)
                     + sin_deg(3.0 * m) * 0.000289;

    const f64 omega = 125.04 - 1934.136 * t;
    const f64 apparent_longitude = l0 + center - 0.00569 - 0.00478 * sin_deg(omega);

    const f64 mean_obliquity = 23.0 + (26.0 + (21.448 - t * (46.815 + t * (0.00059 - t * 0.001813))) / 60.0) / 60.0;
    const f64 obliquity = mean_obliquity + 0.00256 * cos_deg(omega);

    return Coordinates::ecliptic_to_equatorial(apparent_longitude * astro_constants::kDegToRad,
                                               0.0,
                                               obliquity * astro_constants::kDegToRad);
}

HorizontalCoord SolarPosition::true_horizontal(const ObserverLocation& observer, f64 jd)
{
    const EquatorialCoord sun = apparent_equatorial(jd);
    const f64 lst = TimeSystem::lmst(jd, observer.longitude_rad);
    return Coordinates::equatorial_to_horizontal(sun, observer, lst);
}

SolarAngles SolarPosition::angles(f64 latitude_deg,
                                  f64 longitude_deg,
                                  Timestamp ts,
                                  const RefractionModel& refraction)
{
    const ObserverLocation observer{
        .latitude_rad  = latitude_deg * astro_constants::kDegToRad,
        .longitude_rad = longitude_deg * astro_constants::kDegToRad,
    };

    const HorizontalCoord hz = true_horizontal(observer, TimeSystem::to_julian_date(ts));
    const f64 true_alt_deg = hz.alt * astro_constants::kRadToDeg;

    return SolarAngles{
        .elevation_deg = true_alt_deg + refraction_deg(true_alt_deg, refraction),
        .azimuth_deg   = hz.az * astro_constants::kRadToDeg,
    };
}

// -----------------------------------------------------------------
// Refraction: Saemundsson (1986)
//
// R [arcmin] = 1.02 / tan(h + 10.3 / (h + 5.11))   (h = true altitude, degrees)
// scaled by (P / 1010) × (283 / (273 + T))
// -----------------------------------------------------------------

f64 SolarPosition::refraction_deg(f64 true_altitude_deg, const RefractionModel& refraction)
{
    if (!refraction.enabled || true_altitude_deg < -1.0)
    {
        return 0.0;
    }

    const f64 scale = (refraction.pressure_hpa / 1010.0)
                    * (283.0 / (273.0 + refraction.temperature_c));
    const f64 r_arcmin = 1.02 / std::tan((true_altitude_deg + 10.3 / (true_altitude_deg + 5.11))
                                         * astro_constants::kDegToRad);
    return std::max(r_arcmin * scale, 0.0) / 60.0;
}

} // namespace slantcol::astro
