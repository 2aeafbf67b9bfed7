/// @file test_time_system.cpp
/// @brief Unit tests for slantcol::astro::TimeSystem.
///
/// Covers the Julian Date of UTC instants used by the solar series,
/// sidereal time at the sites the tool runs for, UTC instant
/// parsing/formatting and cadence bucket alignment.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace slantcol;
using namespace slantcol::astro;
using namespace std::chrono;

// =================================================================
// Fixtures
// =================================================================

static constexpr f64 kJdTolerance = 1e-12;  // ~0.2 s near JD 2.46e6
static constexpr f64 kSlcLonRad   = -111.847 * astro_constants::kDegToRad;

static Timestamp utc(int y, unsigned m, unsigned d, int hh, int mm = 0, int ss = 0)
{
    return Timestamp{sys_days{year{y} / month{m} / day{d}}} + hours{hh} + minutes{mm} + seconds{ss};
}

// =================================================================
// Julian Date of an instant
// =================================================================

TEST_CASE("Unix epoch instant maps to JD 2440587.5")
{
    const Timestamp epoch{Seconds{0}};
    CHECK(TimeSystem::to_julian_date(epoch) == doctest::Approx(astro_constants::kUnixEpochJd).epsilon(1e-12));
}

TEST_CASE("J2000.0 instant maps to JD 2451545.0")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2000, 1, 1, 12));
    CHECK(jd == doctest::Approx(astro_constants::kJ2000).epsilon(kJdTolerance));
    CHECK(TimeSystem::julian_centuries(jd) == doctest::Approx(0.0).epsilon(1e-12));
}

TEST_CASE("Receptor instants map to the expected Julian Dates")
{
    // 2023-07-08 12:00 UTC is JD 2460134.0
    CHECK(TimeSystem::to_julian_date(utc(2023, 7, 8, 18)) == doctest::Approx(2460134.25).epsilon(kJdTolerance));
    CHECK(TimeSystem::to_julian_date(utc(2022, 6, 16, 0)) == doctest::Approx(2459746.5).epsilon(kJdTolerance));
}

TEST_CASE("One cadence step advances the Julian Date by cadence / 86400")
{
    const Timestamp t0 = utc(2023, 7, 8, 6);

    SUBCASE("One hour")
    {
        const f64 step = TimeSystem::to_julian_date(t0 + hours{1}) - TimeSystem::to_julian_date(t0);
        CHECK(step == doctest::Approx(1.0 / 24.0).epsilon(1e-6));
    }

    SUBCASE("Ten seconds")
    {
        const f64 step = TimeSystem::to_julian_date(t0 + Seconds{10}) - TimeSystem::to_julian_date(t0);
        CHECK(step == doctest::Approx(10.0 / 86400.0).epsilon(1e-4));
    }
}

TEST_CASE("Julian centuries in the solar series range")
{
    // 2023-07-08 18:00 UTC lies 8589.25 days after J2000.0
    const f64 t = TimeSystem::julian_centuries(TimeSystem::to_julian_date(utc(2023, 7, 8, 18)));
    CHECK(t == doctest::Approx(8589.25 / 36525.0).epsilon(1e-9));
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 is 280.46061837 degrees")
{
    const f64 gmst_deg = TimeSystem::gmst(astro_constants::kJ2000) * astro_constants::kRadToDeg;
    CHECK(gmst_deg == doctest::Approx(280.46061837).epsilon(1e-9));
}

TEST_CASE("GMST gains about 0.9856 degrees per solar day")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2023, 7, 8, 18));
    f64 gain_deg = (TimeSystem::gmst(jd + 1.0) - TimeSystem::gmst(jd)) * astro_constants::kRadToDeg;
    if (gain_deg < 0.0)
    {
        gain_deg += 360.0;
    }
    CHECK(gain_deg == doctest::Approx(0.98564736629).epsilon(1e-6));
}

TEST_CASE("LMST stays in [0, 2π) west of Greenwich")
{
    for (int hour = 0; hour < 24; hour += 3)
    {
        const f64 lmst_val = TimeSystem::lmst(TimeSystem::to_julian_date(utc(2023, 7, 8, hour)), kSlcLonRad);
        CHECK(lmst_val >= 0.0);
        CHECK(lmst_val < astro_constants::kTwoPi);
    }
}

TEST_CASE("LMST at Salt Lake City trails GMST by the site longitude")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2023, 7, 8, 18));

    f64 lag = TimeSystem::gmst(jd) - TimeSystem::lmst(jd, kSlcLonRad);
    if (lag < 0.0)
    {
        lag += astro_constants::kTwoPi;
    }
    CHECK(lag == doctest::Approx(111.847 * astro_constants::kDegToRad).epsilon(1e-10));
}

TEST_CASE("LMST at Greenwich equals GMST")
{
    const f64 jd = TimeSystem::to_julian_date(utc(2022, 6, 16, 0));
    CHECK(TimeSystem::lmst(jd, 0.0) == doctest::Approx(TimeSystem::gmst(jd)).epsilon(1e-12));
}

// =================================================================
// Civil breakdown
// =================================================================

TEST_CASE("to_datetime splits an instant into UTC fields")
{
    const DateTime dt = TimeSystem::to_datetime(utc(2023, 7, 8, 18, 5, 9));

    CHECK(dt.year   == 2023);
    CHECK(dt.month  == 7);
    CHECK(dt.day    == 8);
    CHECK(dt.hour   == 18);
    CHECK(dt.minute == 5);
    CHECK(dt.second == 9.0);
}

TEST_CASE("to_datetime at the last second of a leap-year February")
{
    const DateTime dt = TimeSystem::to_datetime(utc(2024, 2, 29, 23, 59, 59));

    CHECK(dt.month  == 2);
    CHECK(dt.day    == 29);
    CHECK(dt.hour   == 23);
    CHECK(dt.second == 59.0);
}

// =================================================================
// Parsing
// =================================================================

TEST_CASE("parse_timestamp accepts space and T separators")
{
    const auto a = TimeSystem::parse_timestamp("2022-06-16 00:00:00");
    const auto b = TimeSystem::parse_timestamp("2022-06-16T00:00:00Z");

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    CHECK(*a == *b);
    CHECK(TimeSystem::format_iso8601(*a) == "2022-06-16T00:00:00Z");
}

TEST_CASE("parse_timestamp applies zone suffix and default offset")
{
    const auto utc = TimeSystem::parse_timestamp("2023-07-08 18:00:00Z");
    REQUIRE(utc.has_value());

    SUBCASE("Explicit suffix")
    {
        const auto mdt = TimeSystem::parse_timestamp("2023-07-08T12:00:00-06:00");
        REQUIRE(mdt.has_value());
        CHECK(*mdt == *utc);
    }

    SUBCASE("Default offset when no suffix")
    {
        const auto mdt = TimeSystem::parse_timestamp("2023-07-08 12:00:00", Seconds{-6 * 3600});
        REQUIRE(mdt.has_value());
        CHECK(*mdt == *utc);
    }

    SUBCASE("Suffix overrides default offset")
    {
        const auto z = TimeSystem::parse_timestamp("2023-07-08 18:00:00Z", Seconds{3600});
        REQUIRE(z.has_value());
        CHECK(*z == *utc);
    }
}

TEST_CASE("parse_timestamp rounds fractional seconds")
{
    const auto down = TimeSystem::parse_timestamp("2023-07-08 18:00:00.4");
    const auto up = TimeSystem::parse_timestamp("2023-07-08 18:00:00.6");
    REQUIRE(down.has_value());
    REQUIRE(up.has_value());
    CHECK(TimeSystem::format_iso8601(*down) == "2023-07-08T18:00:00Z");
    CHECK(TimeSystem::format_iso8601(*up) == "2023-07-08T18:00:01Z");
}

TEST_CASE("parse_timestamp rejects malformed text")
{
    CHECK_FALSE(TimeSystem::parse_timestamp("").has_value());
    CHECK_FALSE(TimeSystem::parse_timestamp("2023-07-08").has_value());
    CHECK_FALSE(TimeSystem::parse_timestamp("2023-13-08 00:00:00").has_value());
    CHECK_FALSE(TimeSystem::parse_timestamp("2023-02-30 00:00:00").has_value());
    CHECK_FALSE(TimeSystem::parse_timestamp("2023-07-08 24:00:00").has_value());
    CHECK_FALSE(TimeSystem::parse_timestamp("2023-07-08 12:00:00 Mars/Olympus").has_value());
}

TEST_CASE("parse_utc_offset forms")
{
    CHECK(TimeSystem::parse_utc_offset("UTC") == Seconds{0});
    CHECK(TimeSystem::parse_utc_offset("Z") == Seconds{0});
    CHECK(TimeSystem::parse_utc_offset("+05:30") == Seconds{5 * 3600 + 30 * 60});
    CHECK(TimeSystem::parse_utc_offset("-0700") == Seconds{-7 * 3600});
    CHECK(TimeSystem::parse_utc_offset("+09") == Seconds{9 * 3600});
    CHECK_FALSE(TimeSystem::parse_utc_offset("US/Mountain").has_value());
    CHECK_FALSE(TimeSystem::parse_utc_offset("+25:00").has_value());
}

TEST_CASE("format supports date-only and compact patterns")
{
    const auto ts = TimeSystem::parse_timestamp("2023-07-08 06:05:04");
    REQUIRE(ts.has_value());
    CHECK(TimeSystem::format(*ts, "%Y%m%d_%H%M%S") == "20230708_060504");
    CHECK(TimeSystem::format(*ts, "%Y-%m-%d") == "2023-07-08");
}

// =================================================================
// Cadence buckets
// =================================================================

TEST_CASE("floor_to / ceil_to on hourly buckets")
{
    const auto ts = TimeSystem::parse_timestamp("2023-07-08 14:37:12");
    const auto on_boundary = TimeSystem::parse_timestamp("2023-07-08 14:00:00");
    REQUIRE(ts.has_value());
    REQUIRE(on_boundary.has_value());

    const Seconds hour{3600};
    CHECK(TimeSystem::format_iso8601(TimeSystem::floor_to(*ts, hour)) == "2023-07-08T14:00:00Z");
    CHECK(TimeSystem::format_iso8601(TimeSystem::ceil_to(*ts, hour)) == "2023-07-08T15:00:00Z");

    CHECK(TimeSystem::floor_to(*on_boundary, hour) == *on_boundary);
    CHECK(TimeSystem::ceil_to(*on_boundary, hour) == *on_boundary);
}

TEST_CASE("floor_to handles instants before the epoch")
{
    const Timestamp before{Seconds{-10}};
    CHECK(TimeSystem::floor_to(before, Seconds{60}) == Timestamp{Seconds{-60}});
    CHECK(TimeSystem::ceil_to(before, Seconds{60}) == Timestamp{Seconds{0}});
}

// =================================================================
// now() sanity check
// =================================================================

TEST_CASE("now returns a reasonable instant")
{
    const f64 jd = TimeSystem::to_julian_date(TimeSystem::now());

    // Should be after 2020-01-01 (JD ~2458849.5) and before 2100
    CHECK(jd > 2458849.5);
    CHECK(jd < 2488070.0);
}
