/// @file coordinates.cpp
/// @brief Implementation of astronomical coordinate transformations.

#include "astro/coordinates.hpp"

#include "core/types.hpp"

#include <algorithm>
#include <cmath>

namespace slantcol::astro
{

// -----------------------------------------------------------------
// Ecliptic (λ, β) → Equatorial (RA/Dec)  (Meeus, eq. 13.3 / 13.4)
//
// tan(RA)  = (sin λ cos ε − tan β sin ε) / cos λ
// sin(dec) = sin β cos ε + cos β sin ε sin λ
// -----------------------------------------------------------------

EquatorialCoord Coordinates::ecliptic_to_equatorial(f64 lambda, f64 beta, f64 obliquity)
{
    const f64 sin_eps = std::sin(obliquity);
    const f64 cos_eps = std::cos(obliquity);
    const f64 sin_lam = std::sin(lambda);

    const f64 ra = std::atan2(sin_lam * cos_eps - std::tan(beta) * sin_eps, std::cos(lambda));
    const f64 sin_dec = std::sin(beta) * cos_eps + std::cos(beta) * sin_eps * sin_lam;

    return EquatorialCoord{
        .ra  = normalize_radians(ra),
        .dec = std::asin(std::clamp(sin_dec, -1.0, 1.0)),
    };
}

// -----------------------------------------------------------------
// Equatorial (RA/Dec) → Horizontal (Alt/Az)
//
// Hour angle: H = LST - RA
//
// sin(alt) = sin(dec) × sin(lat) + cos(dec) × cos(lat) × cos(H)
//
// Azimuth (north-based):
//   sin(az) × cos(alt) = -cos(dec) × sin(H)
//   cos(az) × cos(alt) =  sin(dec) × cos(lat) - cos(dec) × sin(lat) × cos(H)
// -----------------------------------------------------------------

HorizontalCoord Coordinates::equatorial_to_horizontal(
    const EquatorialCoord& eq,
    const ObserverLocation& observer,
    f64 local_sidereal_time_rad)
{
    const f64 hour_angle = local_sidereal_time_rad - eq.ra;

    const f64 sin_dec = std::sin(eq.dec);
    const f64 cos_dec = std::cos(eq.dec);
    const f64 sin_lat = std::sin(observer.latitude_rad);
    const f64 cos_lat = std::cos(observer.latitude_rad);
    const f64 cos_ha  = std::cos(hour_angle);
    const f64 sin_ha  = std::sin(hour_angle);

    const f64 sin_alt = sin_dec * sin_lat + cos_dec * cos_lat * cos_ha;
    const f64 alt = std::asin(std::clamp(sin_alt, -1.0, 1.0));

    const f64 az_y = -cos_dec * sin_ha;
    const f64 az_x = sin_dec * cos_lat - cos_dec * sin_lat * cos_ha;

    return HorizontalCoord{
        .alt = alt,
        .az  = normalize_radians(std::atan2(az_y, az_x)),
    };
}

f64 Coordinates::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace slantcol::astro
