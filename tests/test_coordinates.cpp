/// @file test_coordinates.cpp
/// @brief Unit tests for slantcol::astro::Coordinates.
///
/// Verifies the equatorial-to-horizontal transform with the Sun at known
/// hour angles and the ecliptic-to-equatorial transform at the equinox and
/// solstice points.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace slantcol;
using namespace slantcol::astro;

// =================================================================
// Tolerance constants
// =================================================================

/// 1 arcminute in radians, loose tolerance for approximate checks
static constexpr f64 kArcMinRad = astro_constants::kDegToRad / 60.0;

/// 1 arcsecond in radians, tight tolerance for precision checks
static constexpr f64 kArcSecRad = astro_constants::kArcSecToRad;

/// Degree tolerance for general angular comparisons
static constexpr f64 kDegTol = 0.5 * astro_constants::kDegToRad;

// =================================================================
// Equatorial → Horizontal: the Sun at characteristic hour angles
// =================================================================

/// Obliquity used for solstice declinations
static constexpr f64 kObliquity = 23.4393 * astro_constants::kDegToRad;

static HorizontalCoord sun_at(f64 dec, f64 hour_angle, f64 latitude_deg)
{
    // Placing the Sun at RA 0 makes the local sidereal time equal to the hour angle
    const EquatorialCoord sun{.ra = 0.0, .dec = dec};
    const ObserverLocation site{.latitude_rad = latitude_deg * astro_constants::kDegToRad, .longitude_rad = 0.0};
    return Coordinates::equatorial_to_horizontal(sun, site, Coordinates::normalize_radians(hour_angle));
}

TEST_CASE("June solstice noon on the Tropic of Cancer puts the Sun overhead")
{
    const auto hz = sun_at(kObliquity, 0.0, 23.4393);
    CHECK(hz.alt == doctest::Approx(astro_constants::kHalfPi).epsilon(kArcSecRad));
}

TEST_CASE("Equinox noon at 45°N: altitude 45°, due south")
{
    const auto hz = sun_at(0.0, 0.0, 45.0);

    CHECK(hz.alt == doctest::Approx(45.0 * astro_constants::kDegToRad).epsilon(kArcSecRad));
    CHECK(hz.az == doctest::Approx(astro_constants::kPi).epsilon(kDegTol));
}

TEST_CASE("Equinox sunrise and sunset sit on the horizon due east and due west")
{
    SUBCASE("Six hours before transit")
    {
        const auto hz = sun_at(0.0, -6.0 * astro_constants::kHourToRad, 40.766);
        CHECK(hz.alt == doctest::Approx(0.0).epsilon(kArcSecRad));
        CHECK(hz.az == doctest::Approx(astro_constants::kHalfPi).epsilon(kArcSecRad));
    }

    SUBCASE("Six hours after transit")
    {
        const auto hz = sun_at(0.0, 6.0 * astro_constants::kHourToRad, 40.766);
        CHECK(hz.alt == doctest::Approx(0.0).epsilon(kArcSecRad));
        CHECK(hz.az == doctest::Approx(3.0 * astro_constants::kHalfPi).epsilon(kArcSecRad));
    }
}

TEST_CASE("Morning Sun is in the eastern half of the sky, afternoon Sun in the western half")
{
    const auto morning = sun_at(kObliquity, -3.0 * astro_constants::kHourToRad, 40.766);
    const auto afternoon = sun_at(kObliquity, 3.0 * astro_constants::kHourToRad, 40.766);

    CHECK(morning.alt > 0.0);
    CHECK(afternoon.alt == doctest::Approx(morning.alt).epsilon(1e-12));
    CHECK(morning.az > 0.0);
    CHECK(morning.az < astro_constants::kPi);
    CHECK(afternoon.az > astro_constants::kPi);
    CHECK(afternoon.az + morning.az == doctest::Approx(astro_constants::kTwoPi).epsilon(1e-12));
}

TEST_CASE("December midnight Sun is far below the horizon at mid-northern latitude")
{
    // alt = -(90° - 40.766°) - 23.4393° at lower culmination
    const auto hz = sun_at(-kObliquity, astro_constants::kPi, 40.766);

    CHECK(hz.alt < 0.0);
    CHECK(hz.alt == doctest::Approx((40.766 - 90.0 - 23.4393) * astro_constants::kDegToRad).epsilon(kArcMinRad));
}

TEST_CASE("Polar day: at the North Pole the June Sun circles at its declination")
{
    for (int hour = 0; hour < 24; hour += 4)
    {
        const auto hz = sun_at(kObliquity, hour * astro_constants::kHourToRad, 90.0);
        CHECK(hz.alt == doctest::Approx(kObliquity).epsilon(kArcMinRad));
    }
}

TEST_CASE("Altitude and azimuth stay in range over a year of declinations")
{
    for (f64 ha_h = 0.0; ha_h < 24.0; ha_h += 1.5)
    {
        for (f64 dec_deg = -23.44; dec_deg <= 23.44; dec_deg += 11.72)
        {
            const auto hz = sun_at(dec_deg * astro_constants::kDegToRad, ha_h * astro_constants::kHourToRad, 40.766);

            CHECK(hz.alt >= -astro_constants::kHalfPi - 1e-10);
            CHECK(hz.alt <=  astro_constants::kHalfPi + 1e-10);
            CHECK(hz.az  >= 0.0);
            CHECK(hz.az  <  astro_constants::kTwoPi + 1e-10);
        }
    }
}

// =================================================================
// Ecliptic → Equatorial tests
// =================================================================

TEST_CASE("Vernal equinox point maps to RA=0, Dec=0")
{
    const f64 obliquity = 23.4393 * astro_constants::kDegToRad;
    const auto eq = Coordinates::ecliptic_to_equatorial(0.0, 0.0, obliquity);

    CHECK(eq.ra == doctest::Approx(0.0).epsilon(kArcSecRad));
    CHECK(eq.dec == doctest::Approx(0.0).epsilon(kArcSecRad));
}

TEST_CASE("Summer solstice point: RA=6h, Dec=+obliquity")
{
    const f64 obliquity = 23.4393 * astro_constants::kDegToRad;
    const auto eq = Coordinates::ecliptic_to_equatorial(astro_constants::kHalfPi, 0.0, obliquity);

    CHECK(eq.ra == doctest::Approx(astro_constants::kHalfPi).epsilon(kArcSecRad));
    CHECK(eq.dec == doctest::Approx(obliquity).epsilon(kArcSecRad));
}

TEST_CASE("Winter solstice point: RA=18h, Dec=-obliquity")
{
    const f64 obliquity = 23.4393 * astro_constants::kDegToRad;
    const auto eq = Coordinates::ecliptic_to_equatorial(3.0 * astro_constants::kHalfPi, 0.0, obliquity);

    CHECK(eq.ra == doctest::Approx(3.0 * astro_constants::kHalfPi).epsilon(kArcSecRad));
    CHECK(eq.dec == doctest::Approx(-obliquity).epsilon(kArcSecRad));
}

TEST_CASE("normalize_radians wraps into [0, 2π)")
{
    CHECK(Coordinates::normalize_radians(-astro_constants::kHalfPi)
          == doctest::Approx(3.0 * astro_constants::kHalfPi).epsilon(1e-12));
    CHECK(Coordinates::normalize_radians(5.0 * astro_constants::kPi)
          == doctest::Approx(astro_constants::kPi).epsilon(1e-12));
    CHECK(Coordinates::normalize_radians(0.0) == 0.0);
}
