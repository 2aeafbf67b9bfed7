/// @file elevation_source.cpp
/// @brief In-memory raster and scattered-point terrain sources.

#include "terrain/elevation_source.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <utility>

namespace slantcol::terrain
{

// -----------------------------------------------------------------
// GeoBounds
// -----------------------------------------------------------------

GeoBounds GeoBounds::intersect(const GeoBounds& other) const
{
    return GeoBounds{
        .min_lat = std::max(min_lat, other.min_lat),
        .max_lat = std::min(max_lat, other.max_lat),
        .min_lon = std::max(min_lon, other.min_lon),
        .max_lon = std::min(max_lon, other.max_lon),
    };
}

GeoBounds GeoBounds::around(f64 center_lat, f64 center_lon, f64 radius_m)
{
    const f64 dlat = radius_m / earth_constants::kMetresPerDeg;

    // Longitude degrees shrink toward the poles; widen for the worst latitude in the box
    const f64 worst_lat = std::min(std::abs(center_lat) + dlat, 89.999);
    const f64 dlon = dlat / std::cos(glm::radians(worst_lat));

    return GeoBounds{
        .min_lat = std::max(center_lat - dlat, -90.0),
        .max_lat = std::min(center_lat + dlat, 90.0),
        .min_lon = center_lon - dlon,
        .max_lon = center_lon + dlon,
    };
}

// -----------------------------------------------------------------
// RegularGridSource
// -----------------------------------------------------------------

RegularGridSource::RegularGridSource(std::string label,
                                     f64 north_lat,
                                     f64 west_lon,
                                     f64 cell_size_deg,
                                     u32 nrows,
                                     u32 ncols,
                                     std::vector<f64> values,
                                     f64 nodata)
    : m_label{std::move(label)}
    , m_north_lat{north_lat}
    , m_west_lon{west_lon}
    , m_cell_size{cell_size_deg}
    , m_nrows{nrows}
    , m_ncols{ncols}
    , m_values{std::move(values)}
    , m_nodata{nodata}
{
}

GeoBounds RegularGridSource::extent() const
{
    // Each sample stands for the cell around it
    const f64 half = 0.5 * m_cell_size;
    return GeoBounds{
        .min_lat = m_north_lat - static_cast<f64>(m_nrows - 1) * m_cell_size - half,
        .max_lat = m_north_lat + half,
        .min_lon = m_west_lon - half,
        .max_lon = m_west_lon + static_cast<f64>(m_ncols - 1) * m_cell_size + half,
    };
}

std::vector<ElevationGridCell> RegularGridSource::cells_within(const GeoBounds& bounds) const
{
    std::vector<ElevationGridCell> cells;
    if (bounds.empty() || m_nrows == 0 || m_ncols == 0)
    {
        return cells;
    }

    constexpr f64 kEdgeTol = 1e-9;
    const auto last_row = static_cast<f64>(m_nrows - 1);
    const auto last_col = static_cast<f64>(m_ncols - 1);

    const f64 row_lo = std::max(std::ceil((m_north_lat - bounds.max_lat) / m_cell_size - kEdgeTol), 0.0);
    const f64 row_hi = std::min(std::floor((m_north_lat - bounds.min_lat) / m_cell_size + kEdgeTol), last_row);
    const f64 col_lo = std::max(std::ceil((bounds.min_lon - m_west_lon) / m_cell_size - kEdgeTol), 0.0);
    const f64 col_hi = std::min(std::floor((bounds.max_lon - m_west_lon) / m_cell_size + kEdgeTol), last_col);

    if (row_lo > row_hi || col_lo > col_hi)
    {
        return cells;
    }

    const auto r0 = static_cast<u32>(row_lo);
    const auto r1 = static_cast<u32>(row_hi);
    const auto c0 = static_cast<u32>(col_lo);
    const auto c1 = static_cast<u32>(col_hi);

    cells.reserve(static_cast<std::size_t>(r1 - r0 + 1) * (c1 - c0 + 1));
    for (u32 r = r0; r <= r1; ++r)
    {
        const f64 lat = m_north_lat - static_cast<f64>(r) * m_cell_size;
        for (u32 c = c0; c <= c1; ++c)
        {
            const u64 index = static_cast<u64>(r) * m_ncols + c;
            const f64 value = m_values[index];
            if (value == m_nodata || std::isnan(value))
            {
                continue;
            }

            cells.push_back(ElevationGridCell{
                .latitude   = lat,
                .longitude  = m_west_lon + static_cast<f64>(c) * m_cell_size,
                .elevation  = value,
                .grid_index = index,
            });
        }
    }

    return cells;
}

// -----------------------------------------------------------------
// ScatteredPointSource
// -----------------------------------------------------------------

ScatteredPointSource::ScatteredPointSource(std::string label, std::vector<ElevationGridCell> cells)
    : m_label{std::move(label)}
    , m_cells{std::move(cells)}
    , m_extent{
          .min_lat = std::numeric_limits<f64>::max(),
          .max_lat = std::numeric_limits<f64>::lowest(),
          .min_lon = std::numeric_limits<f64>::max(),
          .max_lon = std::numeric_limits<f64>::lowest(),
      }
{
    for (std::size_t i = 0; i < m_cells.size(); ++i)
    {
        ElevationGridCell& cell = m_cells[i];
        cell.grid_index = i;

        m_extent.min_lat = std::min(m_extent.min_lat, cell.latitude);
        m_extent.max_lat = std::max(m_extent.max_lat, cell.latitude);
        m_extent.min_lon = std::min(m_extent.min_lon, cell.longitude);
        m_extent.max_lon = std::max(m_extent.max_lon, cell.longitude);
    }
}

std::vector<ElevationGridCell> ScatteredPointSource::cells_within(const GeoBounds& bounds) const
{
    std::vector<ElevationGridCell> cells;
    std::copy_if(m_cells.begin(), m_cells.end(), std::back_inserter(cells),
                 [&bounds](const ElevationGridCell& cell) {
                     return bounds.contains(cell.latitude, cell.longitude);
                 });
    return cells;
}

} // namespace slantcol::terrain
