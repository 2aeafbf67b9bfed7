/// @file slant_column_builder.cpp
/// @brief Slant profile construction.

#include "column/slant_column_builder.hpp"

#include <algorithm>
#include <limits>
#include <vector>

namespace slantcol::column
{

SlantColumnBuilder::SlantColumnBuilder(const geodesy::SolarGeodesyOptions& options)
    : m_engine{options}
{
}

SlantProfile SlantColumnBuilder::build_profile(const InstrumentPosition& instrument,
                                               Timestamp timestamp,
                                               std::span<const f64> heights) const
{
    std::vector<f64> sorted(heights.begin(), heights.end());
    std::sort(sorted.begin(), sorted.end());

    const geodesy::SlantGeometry geometry = m_engine.geometry(instrument.latitude, instrument.longitude, timestamp);
    const geodesy::GeoPoint origin{.latitude = instrument.latitude, .longitude = instrument.longitude};

    SlantProfile profile{
        .timestamp = timestamp,
        .condition = geometry.condition,
        .points    = {},
    };
    profile.points.reserve(sorted.size());

    constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();

    for (const f64 height : sorted)
    {
        ReceptorPoint point{
            .timestamp                 = timestamp,
            .height_above_instrument   = height,
            .latitude                  = kNaN,
            .longitude                 = kNaN,
            .elevation_asl             = instrument.elevation_asl + height,
            .surface_elevation         = std::nullopt,
            .height_above_ground_level = std::nullopt,
            .is_above_ground           = false,
            .condition                 = Condition::SolarGeometryUndefined,
        };

        if (geometry.defined())
        {
            const geodesy::SlantProjection projection = m_engine.project_height(geometry, origin, height);
            point.condition = projection.condition;
            if (projection.condition == Condition::None)
            {
                point.latitude  = projection.point.latitude;
                point.longitude = projection.point.longitude;
            }
        }

        profile.points.push_back(point);
    }

    return profile;
}

} // namespace slantcol::column
