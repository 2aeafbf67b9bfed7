#pragma once

/// @file ground_level_resolver.hpp
/// @brief Annotates slant profiles with surface elevation and height above ground.

#include "column/receptor.hpp"
#include "terrain/elevation_index.hpp"

namespace slantcol::column
{
    /// @brief Static utility class resolving ground level for receptor points.
    ///
    /// Points below ground are kept with is_above_ground = false. A point
    /// outside terrain coverage keeps empty surface fields and is tagged
    /// CoverageGap. Points without slant geometry pass through untouched.
    class GroundLevelResolver
    {
    public:
        GroundLevelResolver() = delete;

        /// @brief Annotated copy of `profile`; the input is left unchanged.
        [[nodiscard]] static SlantProfile resolve(const SlantProfile& profile,
                                                  const terrain::ElevationIndex& index);

        /// @brief Annotated copy of one point.
        [[nodiscard]] static ReceptorPoint resolve_point(const ReceptorPoint& point,
                                                         const terrain::ElevationIndex& index);
    };

} // namespace slantcol::column
