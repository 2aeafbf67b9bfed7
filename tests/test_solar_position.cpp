/// @file test_solar_position.cpp
/// @brief Unit tests for slantcol::astro::SolarPosition.
///
/// Checks the solar series against known declinations and sanity-checks the
/// horizontal angles and refraction correction.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/solar_position.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace slantcol;
using namespace slantcol::astro;
using namespace std::chrono;

// =================================================================
// Tolerances
// =================================================================

static constexpr f64 kDecTolDeg = 0.05;

static Timestamp utc(int y, unsigned m, unsigned d, int hh, int mm = 0)
{
    return Timestamp{sys_days{year{y} / month{m} / day{d}}} + hours{hh} + minutes{mm};
}

// =================================================================
// Apparent equatorial coordinates
// =================================================================

TEST_CASE("Solar declination at the 2023 June solstice is +obliquity")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2023, 6, 21, 14, 58));
    const auto eq = SolarPosition::apparent_equatorial(jd);

    CHECK(eq.dec * astro_constants::kRadToDeg == doctest::Approx(23.44).epsilon(kDecTolDeg / 23.44));
    CHECK(eq.ra * astro_constants::kRadToDeg == doctest::Approx(90.0).epsilon(0.2 / 90.0));
}

TEST_CASE("Solar declination near the 2023 March equinox is zero")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2023, 3, 20, 21, 24));
    const auto eq = SolarPosition::apparent_equatorial(jd);

    CHECK(std::abs(eq.dec * astro_constants::kRadToDeg) < kDecTolDeg);
}

// =================================================================
// Horizontal angles
// =================================================================

TEST_CASE("Salt Lake City late morning in July: sun high in the south-east")
{
    const auto sun = SolarPosition::angles(40.766, -111.847, utc(2023, 7, 8, 18));

    CHECK(sun.elevation_deg > 55.0);
    CHECK(sun.elevation_deg < 70.0);
    CHECK(sun.azimuth_deg > 90.0);
    CHECK(sun.azimuth_deg < 180.0);
}

TEST_CASE("Salt Lake City near local midnight: sun below the horizon")
{
    const auto sun = SolarPosition::angles(40.766, -111.847, utc(2023, 7, 8, 6));

    CHECK(sun.elevation_deg < -10.0);
}

TEST_CASE("Azimuth stays within [0, 360)")
{
    for (int hour = 0; hour < 24; ++hour)
    {
        const auto sun = SolarPosition::angles(-33.9, 151.2, utc(2024, 1, 15, hour));
        CHECK(sun.azimuth_deg >= 0.0);
        CHECK(sun.azimuth_deg < 360.0);
    }
}

// =================================================================
// Refraction
// =================================================================

TEST_CASE("Refraction correction")
{
    const RefractionModel standard{};

    SUBCASE("About half a degree at the horizon")
    {
        CHECK(SolarPosition::refraction_deg(0.0, standard) == doctest::Approx(0.48).epsilon(0.1));
    }

    SUBCASE("Under an arcminute at high altitude")
    {
        CHECK(SolarPosition::refraction_deg(60.0, standard) < 1.0 / 60.0);
        CHECK(SolarPosition::refraction_deg(60.0, standard) > 0.0);
    }

    SUBCASE("Disabled model adds nothing")
    {
        const RefractionModel off{.enabled = false};
        CHECK(SolarPosition::refraction_deg(5.0, off) == 0.0);
    }

    SUBCASE("Nothing well below the horizon")
    {
        CHECK(SolarPosition::refraction_deg(-5.0, standard) == 0.0);
    }

    SUBCASE("Apparent elevation exceeds the true one when enabled")
    {
        const Timestamp ts = utc(2023, 7, 8, 18);
        const auto with = SolarPosition::angles(40.766, -111.847, ts);
        const auto without = SolarPosition::angles(40.766, -111.847, ts, RefractionModel{.enabled = false});
        CHECK(with.elevation_deg > without.elevation_deg);
        CHECK(with.azimuth_deg == without.azimuth_deg);
    }
}
