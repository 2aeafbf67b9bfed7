/// @file elevation_index.cpp
/// @brief Bucketed exact nearest-neighbour search over a terrain subgrid.

#include "terrain/elevation_index.hpp"

#include "core/logger.hpp"
#include "geodesy/geodesic.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace
{

using namespace slantcol;

// Upper bound on the bucket grid; coarser buckets are used for very large subgrids
constexpr i64 kMaxBucketsPerAxis = 2048;

// Source reads outside the subgrid start from this radius and double until a sample is found
constexpr f64 kSourceSearchStartM = 500.0;
constexpr u32 kSourceSearchSteps  = 24;

terrain::ElevationLookup coverage_gap()
{
    return terrain::ElevationLookup{
        .condition  = Condition::CoverageGap,
        .elevation  = std::numeric_limits<f64>::quiet_NaN(),
        .distance_m = std::numeric_limits<f64>::quiet_NaN(),
        .grid_index = 0,
    };
}

/// Linear scan with the same distance and tie-break rules as the bucket search.
const terrain::ElevationGridCell* closest_cell(const std::vector<terrain::ElevationGridCell>& cells,
                                               const geodesy::GeoPoint& query,
                                               f64& best_dist)
{
    best_dist = std::numeric_limits<f64>::infinity();
    const terrain::ElevationGridCell* best = nullptr;
    for (const terrain::ElevationGridCell& cell : cells)
    {
        const f64 d = geodesy::Geodesic::haversine_distance(
            query, geodesy::GeoPoint{.latitude = cell.latitude, .longitude = cell.longitude});
        if (d < best_dist || (d == best_dist && cell.grid_index < best->grid_index))
        {
            best_dist = d;
            best = &cell;
        }
    }
    return best;
}

} // anonymous namespace

namespace slantcol::terrain
{

ElevationIndex::ElevationIndex(std::shared_ptr<const ElevationSource> source, f64 bucket_deg)
    : m_source{std::move(source)}
    , m_requested_bucket_deg{bucket_deg > 0.0 ? bucket_deg : 0.01}
{
}

const std::vector<ElevationGridCell>& ElevationIndex::load_subgrid(f64 center_lat, f64 center_lon, f64 radius_m)
{
    m_cells.clear();
    m_buckets.clear();
    m_bucket_rows = 0;
    m_bucket_cols = 0;

    const GeoBounds requested = GeoBounds::around(center_lat, center_lon, radius_m);
    m_extent = requested.intersect(m_source->extent());

    if (m_extent.empty())
    {
        SLC_CORE_WARN("ElevationIndex: ({:.5f}, {:.5f}) r={:.0f} m lies outside {}",
                      center_lat, center_lon, radius_m, m_source->name());
        return m_cells;
    }

    m_cells = m_source->cells_within(m_extent);
    if (m_cells.empty())
    {
        SLC_CORE_WARN("ElevationIndex: No valid samples in {} around ({:.5f}, {:.5f})",
                      m_source->name(), center_lat, center_lon);
        return m_cells;
    }

    build_buckets();

    SLC_CORE_INFO("ElevationIndex: Loaded {} of {} cells from {} within {:.0f} m of ({:.5f}, {:.5f})",
                  m_cells.size(), m_source->size(), m_source->name(), radius_m, center_lat, center_lon);
    SLC_CORE_DEBUG("ElevationIndex: {}x{} buckets of {:.4f} deg",
                   m_bucket_rows, m_bucket_cols, m_bucket_deg);

    return m_cells;
}

// -----------------------------------------------------------------
// Bucket construction
// -----------------------------------------------------------------

void ElevationIndex::build_buckets()
{
    const f64 lat_span = m_extent.max_lat - m_extent.min_lat;
    const f64 lon_span = m_extent.max_lon - m_extent.min_lon;
    const f64 widest = std::max(lat_span, lon_span);

    m_bucket_deg = std::max(m_requested_bucket_deg, widest / static_cast<f64>(kMaxBucketsPerAxis));
    m_bucket_rows = static_cast<i64>(std::floor(lat_span / m_bucket_deg)) + 1;
    m_bucket_cols = static_cast<i64>(std::floor(lon_span / m_bucket_deg)) + 1;

    m_buckets.assign(static_cast<std::size_t>(m_bucket_rows * m_bucket_cols), {});
    for (std::size_t i = 0; i < m_cells.size(); ++i)
    {
        const i64 row = bucket_row(m_cells[i].latitude);
        const i64 col = bucket_col(m_cells[i].longitude);
        m_buckets[static_cast<std::size_t>(row * m_bucket_cols + col)].push_back(static_cast<u32>(i));
    }

    const f64 worst_lat = std::max(std::abs(m_extent.min_lat), std::abs(m_extent.max_lat));
    m_cos_min_lat = std::max(std::cos(glm::radians(std::min(worst_lat, 90.0))), 0.0);
}

i64 ElevationIndex::bucket_row(f64 lat) const
{
    const auto row = static_cast<i64>(std::floor((lat - m_extent.min_lat) / m_bucket_deg));
    return std::clamp<i64>(row, 0, m_bucket_rows - 1);
}

i64 ElevationIndex::bucket_col(f64 lon) const
{
    const auto col = static_cast<i64>(std::floor((lon - m_extent.min_lon) / m_bucket_deg));
    return std::clamp<i64>(col, 0, m_bucket_cols - 1);
}

// -----------------------------------------------------------------
// Ring search
//
// Every cell outside ring k differs from the query by more than k buckets
// in latitude or longitude, so its haversine distance is at least
//   d_k = 2 R asin(cos φ_min · sin(k b / 2))
// Once the best distance found is below d_k the answer is final.
// -----------------------------------------------------------------

ElevationLookup ElevationIndex::nearest_elevation(f64 lat, f64 lon) const
{
    if (m_cells.empty() || !m_extent.contains(lat, lon))
    {
        if (m_source && m_source->extent().contains(lat, lon))
        {
            return nearest_from_source(lat, lon);
        }
        return coverage_gap();
    }

    const geodesy::GeoPoint query{.latitude = lat, .longitude = lon};
    const i64 q_row = bucket_row(lat);
    const i64 q_col = bucket_col(lon);
    const i64 max_ring = std::max(m_bucket_rows, m_bucket_cols);
    const f64 bucket_rad = glm::radians(m_bucket_deg);

    f64 best_dist = std::numeric_limits<f64>::infinity();
    u64 best_index = std::numeric_limits<u64>::max();
    const ElevationGridCell* best = nullptr;

    auto visit = [&](i64 row, i64 col) {
        if (row < 0 || row >= m_bucket_rows || col < 0 || col >= m_bucket_cols)
        {
            return;
        }
        for (const u32 i : m_buckets[static_cast<std::size_t>(row * m_bucket_cols + col)])
        {
            const ElevationGridCell& cell = m_cells[i];
            const f64 d = geodesy::Geodesic::haversine_distance(
                query, geodesy::GeoPoint{.latitude = cell.latitude, .longitude = cell.longitude});
            if (d < best_dist || (d == best_dist && cell.grid_index < best_index))
            {
                best_dist = d;
                best_index = cell.grid_index;
                best = &cell;
            }
        }
    };

    for (i64 k = 0; k <= max_ring; ++k)
    {
        if (k == 0)
        {
            visit(q_row, q_col);
        }
        else
        {
            for (i64 c = q_col - k; c <= q_col + k; ++c)
            {
                visit(q_row - k, c);
                visit(q_row + k, c);
            }
            for (i64 r = q_row - k + 1; r <= q_row + k - 1; ++r)
            {
                visit(r, q_col - k);
                visit(r, q_col + k);
            }
        }

        if (best != nullptr)
        {
            const f64 half = std::min(0.5 * static_cast<f64>(k) * bucket_rad, astro_constants::kHalfPi);
            const f64 bound = 2.0 * earth_constants::kMeanRadius
                            * std::asin(std::min(m_cos_min_lat * std::sin(half), 1.0));
            if (best_dist < bound)
            {
                break;
            }
        }
    }

    return ElevationLookup{
        .condition  = Condition::None,
        .elevation  = best->elevation,
        .distance_m = best_dist,
        .grid_index = best->grid_index,
    };
}

// -----------------------------------------------------------------
// Source fallback
//
// The first box that holds any sample bounds the answer's distance; a
// second read with that distance as radius then contains every sample
// that could be as close, so the result matches a scan of the source.
// -----------------------------------------------------------------

ElevationLookup ElevationIndex::nearest_from_source(f64 lat, f64 lon) const
{
    const geodesy::GeoPoint query{.latitude = lat, .longitude = lon};

    std::vector<ElevationGridCell> cells;
    f64 radius = kSourceSearchStartM;
    for (u32 step = 0; step < kSourceSearchSteps && cells.empty(); ++step)
    {
        cells = m_source->cells_within(GeoBounds::around(lat, lon, radius));
        radius *= 2.0;
    }
    if (cells.empty())
    {
        return coverage_gap();
    }

    f64 best_dist = 0.0;
    const ElevationGridCell* best = closest_cell(cells, query, best_dist);

    // Slight margin so samples at exactly best_dist survive the box test
    std::vector<ElevationGridCell> ring = m_source->cells_within(
        GeoBounds::around(lat, lon, best_dist * 1.001 + 1.0));
    if (!ring.empty())
    {
        cells = std::move(ring);
        best = closest_cell(cells, query, best_dist);
    }

    return ElevationLookup{
        .condition  = Condition::None,
        .elevation  = best->elevation,
        .distance_m = best_dist,
        .grid_index = best->grid_index,
    };
}

} // namespace slantcol::terrain
