#pragma once

/// @file time_system.hpp
/// @brief Astronomical time utilities: Julian Date, sidereal time, UTC instants.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace slantcol::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Date of a `Timestamp` (UTC, one-second resolution),
    /// Greenwich/Local Mean Sidereal Time (IAU 1982), civil breakdown of an
    /// instant, and parsing/formatting of configuration and output times.
    /// All angular results are in radians unless noted otherwise.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert a UTC instant to Julian Date.
        [[nodiscard]] static f64 to_julian_date(Timestamp ts);

        /// @brief Compute Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (radians), normalized to [0, 2π).
        /// Uses the IAU 1982 formula (accurate to ~0.1 second of time).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time (radians), normalized to [0, 2π).
        /// @param longitude_rad Observer longitude in radians (east positive).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);

        /// @brief Civil UTC date/time of an instant (whole seconds).
        [[nodiscard]] static DateTime to_datetime(Timestamp ts);

        /// @brief Current system time truncated to whole seconds.
        [[nodiscard]] static Timestamp now();

        /// @brief Round down to the start of the cadence bucket containing `ts`.
        /// Buckets are aligned to the Unix epoch.
        [[nodiscard]] static Timestamp floor_to(Timestamp ts, Seconds cadence);

        /// @brief Round up to the end of the cadence bucket containing `ts`.
        /// An instant already on a bucket boundary is returned unchanged.
        [[nodiscard]] static Timestamp ceil_to(Timestamp ts, Seconds cadence);

        /// @brief Parse "YYYY-MM-DD HH:MM:SS[.fff][Z|±HH:MM]" (a 'T' separator is accepted).
        /// @param default_offset UTC offset applied when the text carries no zone suffix.
        /// @return The UTC instant, or std::nullopt on malformed input.
        [[nodiscard]] static std::optional<Timestamp> parse_timestamp(std::string_view text,
                                                                      Seconds default_offset = Seconds{0});

        /// @brief Parse a zone designator: "UTC", "Z", "+HH:MM", "-HHMM", "+HH".
        [[nodiscard]] static std::optional<Seconds> parse_utc_offset(std::string_view text);

        /// @brief Format as ISO-8601 UTC, e.g. "2023-07-08T18:00:00Z".
        [[nodiscard]] static std::string format_iso8601(Timestamp ts);

        /// @brief Format with a custom strftime-like subset: %Y %m %d %H %M %S.
        [[nodiscard]] static std::string format(Timestamp ts, std::string_view pattern);

    private:
        /// @brief Normalize an angle to the range [0, 2π).
        [[nodiscard]] static f64 normalize_radians(f64 angle);
    };

} // namespace slantcol::astro
