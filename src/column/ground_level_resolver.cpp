/// @file ground_level_resolver.cpp
/// @brief Height-above-ground resolution against an elevation index.

#include "column/ground_level_resolver.hpp"

namespace slantcol::column
{

SlantProfile GroundLevelResolver::resolve(const SlantProfile& profile, const terrain::ElevationIndex& index)
{
    SlantProfile resolved{
        .timestamp = profile.timestamp,
        .condition = profile.condition,
        .points    = {},
    };
    resolved.points.reserve(profile.points.size());

    for (const ReceptorPoint& point : profile.points)
    {
        resolved.points.push_back(resolve_point(point, index));
    }

    return resolved;
}

// agl = asl - surface, is_above_ground = agl >= 0
ReceptorPoint GroundLevelResolver::resolve_point(const ReceptorPoint& point, const terrain::ElevationIndex& index)
{
    ReceptorPoint resolved = point;
    if (point.condition != Condition::None)
    {
        return resolved;
    }

    const terrain::ElevationLookup lookup = index.nearest_elevation(point.latitude, point.longitude);
    if (!lookup.found())
    {
        resolved.surface_elevation.reset();
        resolved.height_above_ground_level.reset();
        resolved.is_above_ground = false;
        resolved.condition = lookup.condition;
        return resolved;
    }

    const f64 agl = point.elevation_asl - lookup.elevation;
    resolved.surface_elevation = lookup.elevation;
    resolved.height_above_ground_level = agl;
    resolved.is_above_ground = agl >= 0.0;

    return resolved;
}

} // namespace slantcol::column
