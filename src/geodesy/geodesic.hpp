#pragma once

/// @file geodesic.hpp
/// @brief Geodesic problems on the WGS84 ellipsoid and the haversine sphere.

#include "core/types.hpp"

#include <optional>

namespace slantcol::geodesy
{
    /// @brief Geographic point in degrees.
    struct GeoPoint
    {
        f64 latitude;   ///< Geodetic latitude (degrees, north positive)
        f64 longitude;  ///< Longitude (degrees, east positive, -180..180)
    };

    /// @brief Result of the direct problem.
    struct DirectSolution
    {
        GeoPoint destination;
        f64      final_azimuth_deg;  ///< Forward azimuth at the destination (0..360)
    };

    /// @brief Result of the inverse problem.
    struct InverseSolution
    {
        f64 distance_m;
        f64 initial_azimuth_deg;  ///< Forward azimuth at the first point (0..360)
        f64 final_azimuth_deg;    ///< Forward azimuth at the second point (0..360)
    };

    /// @brief Static utility class for geodesic computations.
    ///
    /// The ellipsoidal problems use Vincenty's (1975) iterative series, which
    /// resolve distances to well under a millimetre for the tens of kilometres
    /// a slant column spans.
    class Geodesic
    {
    public:
        Geodesic() = delete;

        /// @brief Direct problem: start point + azimuth + distance → destination.
        /// @param origin Start point.
        /// @param azimuth_deg Initial bearing, clockwise from north (degrees).
        /// @param distance_m Distance along the ellipsoid (metres, >= 0).
        /// A zero distance returns the origin unchanged.
        [[nodiscard]] static DirectSolution direct(const GeoPoint& origin, f64 azimuth_deg, f64 distance_m);

        /// @brief Inverse problem: two points → distance and azimuths.
        /// @return std::nullopt when the iteration does not converge (nearly antipodal points).
        [[nodiscard]] static std::optional<InverseSolution> inverse(const GeoPoint& from, const GeoPoint& to);

        /// @brief Great-circle distance on a 6371 km sphere (metres).
        [[nodiscard]] static f64 haversine_distance(const GeoPoint& a, const GeoPoint& b);

        /// @brief Wrap a longitude to [-180, 180).
        [[nodiscard]] static f64 normalize_longitude(f64 lon_deg);

        /// @brief Wrap an azimuth to [0, 360).
        [[nodiscard]] static f64 normalize_azimuth(f64 az_deg);
    };

} // namespace slantcol::geodesy
