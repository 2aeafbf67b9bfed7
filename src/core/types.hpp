#pragma once

#include <glm/gtc/constants.hpp>

#include <chrono>
#include <cstdint>

namespace slantcol
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Time types: UTC instants at one-second resolution
    using Seconds   = std::chrono::seconds;
    using Timestamp = std::chrono::sys_seconds;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kTwoPi       = 2.0 * kPi;
        constexpr f64 kHalfPi      = kPi / 2.0;
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kHourToRad   = kPi / 12.0;
        constexpr f64 kArcSecToRad = kPi / (180.0 * 3600.0);
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd = 2440587.5;  // 1970-01-01 00:00 UTC
    }

    // Earth figure constants
    namespace earth_constants
    {
        constexpr f64 kWgs84A        = 6378137.0;                 // Semi-major axis [m]
        constexpr f64 kWgs84F        = 1.0 / 298.257223563;       // Flattening
        constexpr f64 kWgs84B        = kWgs84A * (1.0 - kWgs84F); // Semi-minor axis [m]
        constexpr f64 kMeanRadius    = 6371000.0;                 // Haversine sphere [m]
        constexpr f64 kMetresPerDeg  = kMeanRadius * astro_constants::kDegToRad;
    }
}
