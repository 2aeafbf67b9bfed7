/// @file solar_geodesy.cpp
/// @brief Solar slant path projection.

#include "geodesy/solar_geodesy.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>
#include <limits>

namespace
{

// Elevations within this margin of the threshold count as "on the horizon"
constexpr slantcol::f64 kHorizonEpsilonDeg = 1e-6;

} // anonymous namespace

namespace slantcol::geodesy
{

SolarGeodesyEngine::SolarGeodesyEngine(const SolarGeodesyOptions& options)
    : m_options{options}
{
}

SlantGeometry SolarGeodesyEngine::geometry(f64 instrument_lat, f64 instrument_lon, Timestamp ts) const
{
    const astro::SolarAngles sun = astro::SolarPosition::angles(instrument_lat, instrument_lon, ts,
                                                                m_options.refraction);

    const bool below = sun.elevation_deg <= m_options.min_elevation_deg + kHorizonEpsilonDeg;

    return SlantGeometry{
        .condition           = below ? Condition::SolarGeometryUndefined : Condition::None,
        .solar_elevation_deg = sun.elevation_deg,
        .solar_azimuth_deg   = sun.azimuth_deg,
    };
}

SlantProjection SolarGeodesyEngine::project(f64 instrument_lat,
                                            f64 instrument_lon,
                                            Timestamp ts,
                                            f64 horizontal_distance_m) const
{
    const SlantGeometry geo = geometry(instrument_lat, instrument_lon, ts);
    if (!geo.defined())
    {
        return SlantProjection{
            .condition             = geo.condition,
            .point                 = GeoPoint{.latitude = instrument_lat, .longitude = instrument_lon},
            .horizontal_distance_m = std::numeric_limits<f64>::quiet_NaN(),
            .bearing_deg           = geo.solar_azimuth_deg,
        };
    }

    const DirectSolution solution = Geodesic::direct(
        GeoPoint{.latitude = instrument_lat, .longitude = instrument_lon},
        geo.solar_azimuth_deg,
        horizontal_distance_m);

    return SlantProjection{
        .condition             = Condition::None,
        .point                 = solution.destination,
        .horizontal_distance_m = horizontal_distance_m,
        .bearing_deg           = geo.solar_azimuth_deg,
    };
}

SlantProjection SolarGeodesyEngine::project_height(f64 instrument_lat,
                                                   f64 instrument_lon,
                                                   Timestamp ts,
                                                   f64 height_m) const
{
    return project_height(geometry(instrument_lat, instrument_lon, ts),
                          GeoPoint{.latitude = instrument_lat, .longitude = instrument_lon},
                          height_m);
}

SlantProjection SolarGeodesyEngine::project_height(const SlantGeometry& geometry,
                                                   const GeoPoint& instrument,
                                                   f64 height_m) const
{
    const auto distance = geometry.defined()
                              ? horizontal_distance(height_m, geometry.solar_elevation_deg)
                              : std::nullopt;
    if (!distance)
    {
        return SlantProjection{
            .condition             = Condition::SolarGeometryUndefined,
            .point                 = instrument,
            .horizontal_distance_m = std::numeric_limits<f64>::quiet_NaN(),
            .bearing_deg           = geometry.solar_azimuth_deg,
        };
    }

    const DirectSolution solution = Geodesic::direct(instrument, geometry.solar_azimuth_deg, *distance);

    return SlantProjection{
        .condition             = Condition::None,
        .point                 = solution.destination,
        .horizontal_distance_m = *distance,
        .bearing_deg           = geometry.solar_azimuth_deg,
    };
}

// -----------------------------------------------------------------
// distance = height / tan(elevation)
// -----------------------------------------------------------------

std::optional<f64> SolarGeodesyEngine::horizontal_distance(f64 height_m, f64 solar_elevation_deg) const
{
    if (solar_elevation_deg <= m_options.min_elevation_deg + kHorizonEpsilonDeg)
    {
        return std::nullopt;
    }

    if (height_m == 0.0)
    {
        return 0.0;
    }

    return height_m / std::tan(glm::radians(solar_elevation_deg));
}

} // namespace slantcol::geodesy
