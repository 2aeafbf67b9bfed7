#pragma once

/// @file elevation_source.hpp
/// @brief Pluggable terrain datasets presenting one lat/lon/elevation contract.

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace slantcol::terrain
{
    /// @brief One terrain sample. Elevation is in metres above sea level.
    struct ElevationGridCell
    {
        f64 latitude;
        f64 longitude;
        f64 elevation;
        u64 grid_index;  ///< Position in the source's native ordering (row-major for rasters)
    };

    /// @brief Axis-aligned lat/lon box in degrees (inclusive edges).
    struct GeoBounds
    {
        f64 min_lat;
        f64 max_lat;
        f64 min_lon;
        f64 max_lon;

        [[nodiscard]] bool contains(f64 lat, f64 lon) const
        {
            return lat >= min_lat && lat <= max_lat && lon >= min_lon && lon <= max_lon;
        }

        [[nodiscard]] bool empty() const { return min_lat > max_lat || min_lon > max_lon; }

        [[nodiscard]] GeoBounds intersect(const GeoBounds& other) const;

        /// @brief Box that contains every point within `radius_m` of the centre.
        [[nodiscard]] static GeoBounds around(f64 center_lat, f64 center_lon, f64 radius_m);
    };

    /// @brief Abstract terrain dataset.
    ///
    /// Implementations differ in native grid spacing, layout and vertical
    /// units; all of them hand out cells with elevations converted to metres.
    class ElevationSource
    {
    public:
        virtual ~ElevationSource() = default;

        /// @brief Short description used in log messages.
        [[nodiscard]] virtual std::string name() const = 0;

        /// @brief Bounding extent of the dataset's samples.
        [[nodiscard]] virtual GeoBounds extent() const = 0;

        /// @brief Every valid sample inside `bounds`, in ascending grid_index order.
        [[nodiscard]] virtual std::vector<ElevationGridCell> cells_within(const GeoBounds& bounds) const = 0;

        /// @brief Total number of samples held.
        [[nodiscard]] virtual std::size_t size() const = 0;
    };

    /// @brief Regular north-up lat/lon raster held in memory.
    class RegularGridSource final : public ElevationSource
    {
    public:
        /// @param north_lat Latitude of the centre of the first (northernmost) row.
        /// @param west_lon Longitude of the centre of the first (westernmost) column.
        /// @param cell_size_deg Spacing between cell centres in both axes.
        /// @param values Row-major elevations in metres, `nrows * ncols` entries.
        /// @param nodata Marker for missing samples (skipped on enumeration).
        RegularGridSource(std::string label,
                          f64 north_lat,
                          f64 west_lon,
                          f64 cell_size_deg,
                          u32 nrows,
                          u32 ncols,
                          std::vector<f64> values,
                          f64 nodata);

        [[nodiscard]] std::string name() const override { return m_label; }
        [[nodiscard]] GeoBounds extent() const override;
        [[nodiscard]] std::vector<ElevationGridCell> cells_within(const GeoBounds& bounds) const override;
        [[nodiscard]] std::size_t size() const override { return m_values.size(); }

        [[nodiscard]] u32 rows() const { return m_nrows; }
        [[nodiscard]] u32 cols() const { return m_ncols; }
        [[nodiscard]] f64 cell_size() const { return m_cell_size; }

    private:
        std::string      m_label;
        f64              m_north_lat;
        f64              m_west_lon;
        f64              m_cell_size;
        u32              m_nrows;
        u32              m_ncols;
        std::vector<f64> m_values;
        f64              m_nodata;
    };

    /// @brief Irregular point samples (e.g. surveyed or resampled DEM points).
    class ScatteredPointSource final : public ElevationSource
    {
    public:
        /// @param cells Samples; grid_index is reassigned to the vector order.
        ScatteredPointSource(std::string label, std::vector<ElevationGridCell> cells);

        [[nodiscard]] std::string name() const override { return m_label; }
        [[nodiscard]] GeoBounds extent() const override { return m_extent; }
        [[nodiscard]] std::vector<ElevationGridCell> cells_within(const GeoBounds& bounds) const override;
        [[nodiscard]] std::size_t size() const override { return m_cells.size(); }

    private:
        std::string                    m_label;
        std::vector<ElevationGridCell> m_cells;
        GeoBounds                      m_extent;
    };

} // namespace slantcol::terrain
