/// @file time_system.cpp
/// @brief Implementation of astronomical time utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <cmath>
#include <string>

namespace
{

using namespace slantcol;

std::optional<i32> parse_fixed_int(std::string_view text, std::size_t pos, std::size_t len)
{
    if (pos + len > text.size())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const char* first = text.data() + pos;
    const char* last = first + len;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

std::string_view trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

} // anonymous namespace

namespace slantcol::astro
{

// -----------------------------------------------------------------
// Julian Date of a UTC instant
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(Timestamp ts)
{
    const auto seconds = static_cast<f64>(ts.time_since_epoch().count());
    return astro_constants::kUnixEpochJd + seconds / 86400.0;
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / 36525.0;
}

// -----------------------------------------------------------------
// GMST: IAU 1982 formula
//
// GMST (degrees) = 280.46061837
//                + 360.98564736629 × (JD − 2451545.0)
//                + 0.000387933 × T²
//                − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    f64 gmst_deg = 280.46061837
                 + 360.98564736629 * d
                 + 0.000387933 * t * t
                 - (t * t * t) / 38710000.0;

    gmst_deg = std::fmod(gmst_deg, 360.0);
    if (gmst_deg < 0.0)
    {
        gmst_deg += 360.0;
    }

    return gmst_deg * astro_constants::kDegToRad;
}

f64 TimeSystem::lmst(f64 jd, f64 longitude_rad)
{
    return normalize_radians(gmst(jd) + longitude_rad);
}

// -----------------------------------------------------------------
// Timestamp → civil date/time
// -----------------------------------------------------------------

DateTime TimeSystem::to_datetime(Timestamp ts)
{
    using namespace std::chrono;

    const auto day_point = floor<days>(ts);
    const year_month_day ymd{day_point};
    const hh_mm_ss hms{ts - day_point};

    return DateTime{
        .year   = static_cast<i32>(ymd.year()),
        .month  = static_cast<i32>(static_cast<unsigned>(ymd.month())),
        .day    = static_cast<i32>(static_cast<unsigned>(ymd.day())),
        .hour   = static_cast<i32>(hms.hours().count()),
        .minute = static_cast<i32>(hms.minutes().count()),
        .second = static_cast<f64>(hms.seconds().count()),
    };
}

Timestamp TimeSystem::now()
{
    return std::chrono::floor<Seconds>(std::chrono::system_clock::now());
}

// -----------------------------------------------------------------
// Cadence buckets (aligned to the Unix epoch)
// -----------------------------------------------------------------

Timestamp TimeSystem::floor_to(Timestamp ts, Seconds cadence)
{
    const i64 s = ts.time_since_epoch().count();
    const i64 c = cadence.count();
    i64 q = s / c;
    if (s % c != 0 && s < 0)
    {
        q -= 1;
    }
    return Timestamp{Seconds{q * c}};
}

Timestamp TimeSystem::ceil_to(Timestamp ts, Seconds cadence)
{
    const Timestamp floored = floor_to(ts, cadence);
    return (floored == ts) ? ts : floored + cadence;
}

// -----------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------

std::optional<Timestamp> TimeSystem::parse_timestamp(std::string_view text, Seconds default_offset)
{
    text = trim(text);

    // YYYY-MM-DD HH:MM:SS is the fixed 19-character prefix
    if (text.size() < 19 || text[4] != '-' || text[7] != '-'
        || (text[10] != ' ' && text[10] != 'T') || text[13] != ':' || text[16] != ':')
    {
        return std::nullopt;
    }

    const auto year   = parse_fixed_int(text, 0, 4);
    const auto month  = parse_fixed_int(text, 5, 2);
    const auto day    = parse_fixed_int(text, 8, 2);
    const auto hour   = parse_fixed_int(text, 11, 2);
    const auto minute = parse_fixed_int(text, 14, 2);
    const auto second = parse_fixed_int(text, 17, 2);
    if (!year || !month || !day || !hour || !minute || !second)
    {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                          std::chrono::month{static_cast<unsigned>(*month)},
                                          std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok() || *hour > 23 || *minute > 59 || *second > 59)
    {
        return std::nullopt;
    }

    std::size_t pos = 19;

    // Optional fractional seconds, rounded to the nearest whole second
    i64 round_up = 0;
    if (pos < text.size() && text[pos] == '.')
    {
        const std::size_t frac_start = ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            ++pos;
        }
        if (pos == frac_start)
        {
            return std::nullopt;
        }
        round_up = (text[frac_start] >= '5') ? 1 : 0;
    }

    Seconds offset = default_offset;
    const std::string_view zone = trim(text.substr(pos));
    if (!zone.empty())
    {
        const auto parsed = parse_utc_offset(zone);
        if (!parsed)
        {
            return std::nullopt;
        }
        offset = *parsed;
    }

    const Timestamp local = std::chrono::sys_days{ymd}
                          + std::chrono::hours{*hour}
                          + std::chrono::minutes{*minute}
                          + Seconds{*second + round_up};
    return local - offset;
}

std::optional<Seconds> TimeSystem::parse_utc_offset(std::string_view text)
{
    text = trim(text);
    if (text == "UTC" || text == "Z" || text == "GMT" || text == "Etc/UTC")
    {
        return Seconds{0};
    }
    if (text.size() < 3 || (text[0] != '+' && text[0] != '-'))
    {
        return std::nullopt;
    }

    const i32 sign = (text[0] == '-') ? -1 : 1;
    const auto hours = parse_fixed_int(text, 1, 2);
    if (!hours || *hours > 14)
    {
        return std::nullopt;
    }

    i32 minutes = 0;
    if (text.size() > 3)
    {
        const std::size_t minute_pos = (text[3] == ':') ? 4 : 3;
        const auto parsed = parse_fixed_int(text, minute_pos, 2);
        if (!parsed || *parsed > 59 || text.size() != minute_pos + 2)
        {
            return std::nullopt;
        }
        minutes = *parsed;
    }

    return Seconds{sign * (*hours * 3600 + minutes * 60)};
}

// -----------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------

std::string TimeSystem::format_iso8601(Timestamp ts)
{
    return format(ts, "%Y-%m-%dT%H:%M:%SZ");
}

std::string TimeSystem::format(Timestamp ts, std::string_view pattern)
{
    const DateTime dt = to_datetime(ts);
    const auto second = static_cast<i32>(dt.second);

    std::string out;
    out.reserve(pattern.size() + 8);
    for (std::size_t i = 0; i < pattern.size(); ++i)
    {
        if (pattern[i] != '%' || i + 1 == pattern.size())
        {
            out.push_back(pattern[i]);
            continue;
        }

        switch (pattern[++i])
        {
            case 'Y': out += fmt::format("{:04d}", dt.year);   break;
            case 'm': out += fmt::format("{:02d}", dt.month);  break;
            case 'd': out += fmt::format("{:02d}", dt.day);    break;
            case 'H': out += fmt::format("{:02d}", dt.hour);   break;
            case 'M': out += fmt::format("{:02d}", dt.minute); break;
            case 'S': out += fmt::format("{:02d}", second);    break;
            default:
                out.push_back('%');
                out.push_back(pattern[i]);
                break;
        }
    }
    return out;
}

f64 TimeSystem::normalize_radians(f64 angle)
{
    angle = std::fmod(angle, astro_constants::kTwoPi);
    if (angle < 0.0)
    {
        angle += astro_constants::kTwoPi;
    }
    return angle;
}

} // namespace slantcol::astro
