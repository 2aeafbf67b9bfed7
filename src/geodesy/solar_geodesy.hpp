#pragma once

/// @file solar_geodesy.hpp
/// @brief Projection of heights above an instrument onto the solar slant path.

#include "astro/solar_position.hpp"
#include "core/condition.hpp"
#include "core/types.hpp"
#include "geodesy/geodesic.hpp"

#include <optional>

namespace slantcol::geodesy
{
    /// @brief Tuning for the solar slant geometry.
    struct SolarGeodesyOptions
    {
        astro::RefractionModel refraction{};
        f64 min_elevation_deg{0.0};  ///< Sun at or below this elevation has no slant geometry
    };

    /// @brief Sun direction from an instrument at one instant.
    struct SlantGeometry
    {
        Condition condition;        ///< None or SolarGeometryUndefined
        f64 solar_elevation_deg;
        f64 solar_azimuth_deg;      ///< Bearing of the horizontal offset

        [[nodiscard]] bool defined() const { return condition == Condition::None; }
    };

    /// @brief A projected slant-path point.
    struct SlantProjection
    {
        Condition condition;        ///< None or SolarGeometryUndefined
        GeoPoint  point;            ///< Only meaningful when condition is None
        f64       horizontal_distance_m;
        f64       bearing_deg;
    };

    /// @brief Solar geometry + ellipsoidal projection engine.
    ///
    /// Stateless apart from its options; every member is const and may be
    /// called concurrently from any number of threads.
    class SolarGeodesyEngine
    {
    public:
        explicit SolarGeodesyEngine(const SolarGeodesyOptions& options = {});

        /// @brief Sun elevation/azimuth at `ts` seen from the instrument.
        [[nodiscard]] SlantGeometry geometry(f64 instrument_lat, f64 instrument_lon, Timestamp ts) const;

        /// @brief Move `horizontal_distance_m` along the solar azimuth on the WGS84 ellipsoid.
        /// @return SolarGeometryUndefined when the sun is at or below the horizon.
        [[nodiscard]] SlantProjection project(f64 instrument_lat,
                                              f64 instrument_lon,
                                              Timestamp ts,
                                              f64 horizontal_distance_m) const;

        /// @brief Project a point `height_m` above the instrument onto the slant path.
        ///
        /// The horizontal offset is height / tan(solar elevation).
        [[nodiscard]] SlantProjection project_height(f64 instrument_lat,
                                                     f64 instrument_lon,
                                                     Timestamp ts,
                                                     f64 height_m) const;

        /// @brief Same as above with the solar geometry already computed for the instant.
        [[nodiscard]] SlantProjection project_height(const SlantGeometry& geometry,
                                                     const GeoPoint& instrument,
                                                     f64 height_m) const;

        /// @brief Horizontal distance of the slant path at `height_m`.
        /// @return std::nullopt when the elevation leaves no slant geometry.
        [[nodiscard]] std::optional<f64> horizontal_distance(f64 height_m, f64 solar_elevation_deg) const;

        [[nodiscard]] const SolarGeodesyOptions& options() const { return m_options; }

    private:
        SolarGeodesyOptions m_options;
    };

} // namespace slantcol::geodesy
