#pragma once

/// @file slant_column_builder.hpp
/// @brief Builds the slant-column profile for one instrument and instant.

#include "column/receptor.hpp"
#include "core/types.hpp"
#include "geodesy/solar_geodesy.hpp"

#include <span>

namespace slantcol::column
{
    /// @brief Projects configured heights above an instrument onto the solar slant path.
    ///
    /// The solar geometry is evaluated once per timestamp; each height is
    /// then projected independently along the solar azimuth. When the sun
    /// is at or below the horizon every point in the profile carries
    /// SolarGeometryUndefined and the profile is marked unusable.
    class SlantColumnBuilder
    {
    public:
        explicit SlantColumnBuilder(const geodesy::SolarGeodesyOptions& options = {});

        /// @brief Build one profile. Points come out in ascending height order
        /// regardless of the order of `heights`.
        [[nodiscard]] SlantProfile build_profile(const InstrumentPosition& instrument,
                                                 Timestamp timestamp,
                                                 std::span<const f64> heights) const;

        [[nodiscard]] const geodesy::SolarGeodesyEngine& engine() const { return m_engine; }

    private:
        geodesy::SolarGeodesyEngine m_engine;
    };

} // namespace slantcol::column
