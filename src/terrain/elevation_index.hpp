#pragma once

/// @file elevation_index.hpp
/// @brief Nearest-sample surface elevation lookup over a bounded terrain subgrid.

#include "core/condition.hpp"
#include "core/types.hpp"
#include "terrain/elevation_source.hpp"

#include <memory>
#include <vector>

namespace slantcol::terrain
{
    /// @brief Result of a nearest-elevation query.
    struct ElevationLookup
    {
        Condition condition;   ///< None or CoverageGap
        f64       elevation;   ///< Surface elevation [m ASL], NaN on CoverageGap
        f64       distance_m;  ///< Great-circle distance to the chosen sample
        u64       grid_index;  ///< Source index of the chosen sample

        [[nodiscard]] bool found() const { return condition == Condition::None; }
    };

    /// @brief Owns a terrain subgrid and answers nearest-neighbour queries against it.
    ///
    /// Lifecycle: construct over a source, call load_subgrid() once per run
    /// (or once per region if the instrument moves), then share the index
    /// read-only between any number of worker threads. nearest_elevation()
    /// never mutates the index.
    ///
    /// Loaded cells are bucketed on a regular lat/lon grid. A query walks
    /// square rings of buckets outward from its own bucket and stops once no
    /// unvisited bucket can hold a closer sample, so the answer is identical
    /// to a full scan over every loaded cell. Equidistant samples resolve to
    /// the lowest grid_index.
    ///
    /// Queries that fall outside the loaded subgrid but inside the source
    /// extent are answered from the source directly, by reading a box around
    /// the query point. CoverageGap is reserved for points the dataset does
    /// not cover.
    class ElevationIndex
    {
    public:
        /// @param bucket_deg Edge length of the search buckets in degrees.
        explicit ElevationIndex(std::shared_ptr<const ElevationSource> source, f64 bucket_deg = 0.01);

        /// @brief Load every source sample within `radius_m` of the centre.
        ///
        /// Replaces any previously loaded subgrid. The loaded extent is the
        /// requested box clipped to the source extent.
        /// @return The loaded cells in ascending grid_index order.
        const std::vector<ElevationGridCell>& load_subgrid(f64 center_lat, f64 center_lon, f64 radius_m);

        /// @brief Elevation of the sample nearest to (lat, lon) by great-circle distance.
        ///
        /// Served from the loaded subgrid when it contains the point, from the
        /// source otherwise.
        /// @return CoverageGap when the point lies outside the source extent.
        [[nodiscard]] ElevationLookup nearest_elevation(f64 lat, f64 lon) const;

        [[nodiscard]] const std::vector<ElevationGridCell>& cells() const { return m_cells; }
        [[nodiscard]] const GeoBounds& loaded_extent() const { return m_extent; }
        [[nodiscard]] bool loaded() const { return !m_cells.empty(); }
        [[nodiscard]] const ElevationSource& source() const { return *m_source; }

    private:
        void build_buckets();

        /// @brief Nearest sample read from the source in a box grown around the query.
        [[nodiscard]] ElevationLookup nearest_from_source(f64 lat, f64 lon) const;

        [[nodiscard]] i64 bucket_row(f64 lat) const;
        [[nodiscard]] i64 bucket_col(f64 lon) const;

        std::shared_ptr<const ElevationSource> m_source;
        f64                                    m_requested_bucket_deg;

        std::vector<ElevationGridCell> m_cells;
        GeoBounds                      m_extent{.min_lat = 1.0, .max_lat = -1.0, .min_lon = 1.0, .max_lon = -1.0};

        // Dense bucket grid over m_extent, row-major, each holding indices into m_cells
        std::vector<std::vector<u32>> m_buckets;
        f64                           m_bucket_deg{0.01};
        i64                           m_bucket_rows{0};
        i64                           m_bucket_cols{0};
        f64                           m_cos_min_lat{1.0};
    };

} // namespace slantcol::terrain
