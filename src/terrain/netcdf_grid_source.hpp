#pragma once

/// @file netcdf_grid_source.hpp
/// @brief Terrain raster read on demand from a netCDF file.

#include "core/types.hpp"
#include "terrain/elevation_source.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace slantcol::terrain
{
    /// @brief Variable and coordinate names inside a netCDF terrain file.
    ///
    /// Defaults match the ASTER GDEM v3 netCDF product.
    struct NetcdfLayout
    {
        std::string variable{"ASTER_GDEM_DEM"};
        std::string lat_name{"lat"};
        std::string lon_name{"lon"};
    };

    /// @brief Lat/lon raster kept on disk; cells_within() reads only the requested block.
    ///
    /// The elevation variable must have one dimension for each 1-D coordinate
    /// variable; any further dimension (time, band) is read at index 0.
    /// Coordinates may be ascending or descending but must be strictly
    /// monotonic. Stored values are converted with the CF attributes
    /// scale_factor and add_offset; samples equal to _FillValue or
    /// missing_value, and non-finite ones, are skipped.
    ///
    /// grid_index is `lat_index * lon_count + lon_index` in file order.
    ///
    /// The netCDF library is not thread-safe, so reads are serialized.
    class NetcdfGridSource final : public ElevationSource
    {
    public:
        /// @brief Open `path` and read its coordinate axes.
        /// @param vertical_scale Multiplier applied after scale_factor/add_offset.
        /// @return nullptr on failure (logged).
        [[nodiscard]] static std::unique_ptr<NetcdfGridSource> open(const std::filesystem::path& path,
                                                                    const NetcdfLayout& layout = {},
                                                                    f64 vertical_scale = 1.0);

        ~NetcdfGridSource() override;

        NetcdfGridSource(const NetcdfGridSource&) = delete;
        NetcdfGridSource& operator=(const NetcdfGridSource&) = delete;
        NetcdfGridSource(NetcdfGridSource&&) = delete;
        NetcdfGridSource& operator=(NetcdfGridSource&&) = delete;

        [[nodiscard]] std::string name() const override { return m_label; }
        [[nodiscard]] GeoBounds extent() const override;
        [[nodiscard]] std::vector<ElevationGridCell> cells_within(const GeoBounds& bounds) const override;
        [[nodiscard]] std::size_t size() const override { return m_lats.size() * m_lons.size(); }

        [[nodiscard]] std::size_t lat_count() const { return m_lats.size(); }
        [[nodiscard]] std::size_t lon_count() const { return m_lons.size(); }

    private:
        NetcdfGridSource() = default;

        /// Half-open index range of `axis` values inside [lo, hi].
        struct IndexRange
        {
            std::size_t first;
            std::size_t last;

            [[nodiscard]] std::size_t count() const { return last - first; }
        };

        [[nodiscard]] static IndexRange index_range(const std::vector<f64>& axis, f64 lo, f64 hi);

        std::string         m_label;
        int                 m_ncid{-1};
        int                 m_varid{-1};
        int                 m_ndims{0};
        int                 m_lat_pos{-1};
        int                 m_lon_pos{-1};
        std::vector<f64>    m_lats;
        std::vector<f64>    m_lons;
        f64                 m_scale{1.0};
        f64                 m_offset{0.0};
        f64                 m_vertical_scale{1.0};
        std::optional<f64>  m_fill;
        std::optional<f64>  m_missing;
        mutable std::mutex  m_mutex;
    };

} // namespace slantcol::terrain
