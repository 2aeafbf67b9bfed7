/// @file netcdf_grid_source.cpp
/// @brief netCDF-C backed terrain raster.

#include "terrain/netcdf_grid_source.hpp"

#include "core/logger.hpp"

#include <netcdf.h>

#include <algorithm>
#include <cmath>
#include <functional>

namespace
{

using slantcol::f64;

/// First value of a numeric attribute, std::nullopt when absent or textual
std::optional<f64> numeric_attribute(int ncid, int varid, const char* name)
{
    nc_type type = NC_NAT;
    std::size_t length = 0;
    if (nc_inq_att(ncid, varid, name, &type, &length) != NC_NOERR || length == 0)
    {
        return std::nullopt;
    }
    if (type == NC_CHAR || type == NC_STRING)
    {
        return std::nullopt;
    }

    std::vector<double> values(length);
    if (nc_get_att_double(ncid, varid, name, values.data()) != NC_NOERR)
    {
        return std::nullopt;
    }
    return values.front();
}

/// Read a 1-D coordinate variable and report the dimension it runs along
std::optional<std::vector<f64>> read_axis(int ncid, const std::string& name, const std::string& file, int& dimid)
{
    int varid = -1;
    int rc = nc_inq_varid(ncid, name.c_str(), &varid);
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Coordinate '{}' not found in {}: {}", name, file, nc_strerror(rc));
        return std::nullopt;
    }

    int ndims = 0;
    rc = nc_inq_varndims(ncid, varid, &ndims);
    if (rc != NC_NOERR || ndims != 1)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Coordinate '{}' in {} must be 1-D", name, file);
        return std::nullopt;
    }

    rc = nc_inq_vardimid(ncid, varid, &dimid);
    std::size_t length = 0;
    if (rc == NC_NOERR)
    {
        rc = nc_inq_dimlen(ncid, dimid, &length);
    }
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Cannot inquire '{}' in {}: {}", name, file, nc_strerror(rc));
        return std::nullopt;
    }
    if (length == 0)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Coordinate '{}' in {} is empty", name, file);
        return std::nullopt;
    }

    std::vector<f64> values(length);
    rc = nc_get_var_double(ncid, varid, values.data());
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Cannot read '{}' from {}: {}", name, file, nc_strerror(rc));
        return std::nullopt;
    }

    const bool ascending = std::adjacent_find(values.begin(), values.end(), std::greater_equal<>()) == values.end();
    const bool descending = std::adjacent_find(values.begin(), values.end(), std::less_equal<>()) == values.end();
    if (!ascending && !descending)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Coordinate '{}' in {} is not strictly monotonic", name, file);
        return std::nullopt;
    }

    return values;
}

f64 half_spacing(const std::vector<f64>& axis)
{
    return axis.size() > 1 ? 0.5 * std::abs(axis[1] - axis[0]) : 0.0;
}

} // anonymous namespace

namespace slantcol::terrain
{

// -----------------------------------------------------------------
// Open
// -----------------------------------------------------------------

std::unique_ptr<NetcdfGridSource> NetcdfGridSource::open(const std::filesystem::path& path,
                                                         const NetcdfLayout& layout,
                                                         f64 vertical_scale)
{
    const std::string file = path.string();

    int ncid = -1;
    int rc = nc_open(file.c_str(), NC_NOWRITE, &ncid);
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Failed to open {}: {}", file, nc_strerror(rc));
        return nullptr;
    }

    // Owns ncid from here on; the destructor closes it on every early return
    std::unique_ptr<NetcdfGridSource> source(new NetcdfGridSource());
    source->m_ncid = ncid;
    source->m_label = path.filename().string() + ":" + layout.variable;
    source->m_vertical_scale = vertical_scale;

    int lat_dim = -1;
    int lon_dim = -1;
    auto lats = read_axis(ncid, layout.lat_name, file, lat_dim);
    auto lons = read_axis(ncid, layout.lon_name, file, lon_dim);
    if (!lats || !lons)
    {
        return nullptr;
    }
    source->m_lats = std::move(*lats);
    source->m_lons = std::move(*lons);

    rc = nc_inq_varid(ncid, layout.variable.c_str(), &source->m_varid);
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Variable '{}' not found in {}: {}", layout.variable, file, nc_strerror(rc));
        return nullptr;
    }

    int dimids[NC_MAX_VAR_DIMS];
    rc = nc_inq_varndims(ncid, source->m_varid, &source->m_ndims);
    if (rc == NC_NOERR)
    {
        rc = nc_inq_vardimid(ncid, source->m_varid, dimids);
    }
    if (rc != NC_NOERR)
    {
        SLC_CORE_ERROR("NetcdfGridSource: Cannot inquire '{}' in {}: {}", layout.variable, file, nc_strerror(rc));
        return nullptr;
    }

    for (int i = 0; i < source->m_ndims; ++i)
    {
        if (dimids[i] == lat_dim)
        {
            source->m_lat_pos = i;
        }
        else if (dimids[i] == lon_dim)
        {
            source->m_lon_pos = i;
        }
    }
    if (source->m_lat_pos < 0 || source->m_lon_pos < 0)
    {
        SLC_CORE_ERROR("NetcdfGridSource: '{}' in {} does not run along '{}' and '{}'",
                       layout.variable, file, layout.lat_name, layout.lon_name);
        return nullptr;
    }

    source->m_scale   = numeric_attribute(ncid, source->m_varid, "scale_factor").value_or(1.0);
    source->m_offset  = numeric_attribute(ncid, source->m_varid, "add_offset").value_or(0.0);
    source->m_fill    = numeric_attribute(ncid, source->m_varid, "_FillValue");
    source->m_missing = numeric_attribute(ncid, source->m_varid, "missing_value");

    SLC_CORE_INFO("NetcdfGridSource: Opened {} ({} x {} samples, {} dims)",
                  file, source->m_lats.size(), source->m_lons.size(), source->m_ndims);

    return source;
}

NetcdfGridSource::~NetcdfGridSource()
{
    if (m_ncid >= 0)
    {
        const int rc = nc_close(m_ncid);
        if (rc != NC_NOERR)
        {
            SLC_CORE_WARN("NetcdfGridSource: Closing {} failed: {}", m_label, nc_strerror(rc));
        }
    }
}

// -----------------------------------------------------------------
// Extent: every sample stands for half a spacing around it
// -----------------------------------------------------------------

GeoBounds NetcdfGridSource::extent() const
{
    const auto [lat_lo, lat_hi] = std::minmax(m_lats.front(), m_lats.back());
    const auto [lon_lo, lon_hi] = std::minmax(m_lons.front(), m_lons.back());
    const f64 half_lat = half_spacing(m_lats);
    const f64 half_lon = half_spacing(m_lons);

    return GeoBounds{
        .min_lat = lat_lo - half_lat,
        .max_lat = lat_hi + half_lat,
        .min_lon = lon_lo - half_lon,
        .max_lon = lon_hi + half_lon,
    };
}

NetcdfGridSource::IndexRange NetcdfGridSource::index_range(const std::vector<f64>& axis, f64 lo, f64 hi)
{
    if (lo > hi)
    {
        return IndexRange{.first = 0, .last = 0};
    }

    std::size_t first = 0;
    std::size_t last = 0;
    if (axis.front() <= axis.back())
    {
        first = static_cast<std::size_t>(std::lower_bound(axis.begin(), axis.end(), lo) - axis.begin());
        last  = static_cast<std::size_t>(std::upper_bound(axis.begin(), axis.end(), hi) - axis.begin());
    }
    else
    {
        first = static_cast<std::size_t>(std::lower_bound(axis.begin(), axis.end(), hi, std::greater<>()) - axis.begin());
        last  = static_cast<std::size_t>(std::upper_bound(axis.begin(), axis.end(), lo, std::greater<>()) - axis.begin());
    }

    return IndexRange{.first = first, .last = std::max(first, last)};
}

// -----------------------------------------------------------------
// Block read
// -----------------------------------------------------------------

std::vector<ElevationGridCell> NetcdfGridSource::cells_within(const GeoBounds& bounds) const
{
    std::vector<ElevationGridCell> cells;
    if (bounds.empty())
    {
        return cells;
    }

    const IndexRange lat_range = index_range(m_lats, bounds.min_lat, bounds.max_lat);
    const IndexRange lon_range = index_range(m_lons, bounds.min_lon, bounds.max_lon);
    if (lat_range.count() == 0 || lon_range.count() == 0)
    {
        return cells;
    }

    std::vector<std::size_t> start(static_cast<std::size_t>(m_ndims), 0);
    std::vector<std::size_t> count(static_cast<std::size_t>(m_ndims), 1);
    start[static_cast<std::size_t>(m_lat_pos)] = lat_range.first;
    start[static_cast<std::size_t>(m_lon_pos)] = lon_range.first;
    count[static_cast<std::size_t>(m_lat_pos)] = lat_range.count();
    count[static_cast<std::size_t>(m_lon_pos)] = lon_range.count();

    std::vector<double> block(lat_range.count() * lon_range.count());
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const int rc = nc_get_vara_double(m_ncid, m_varid, start.data(), count.data(), block.data());
        if (rc != NC_NOERR)
        {
            SLC_CORE_ERROR("NetcdfGridSource: Reading lat[{}, {}) lon[{}, {}) of {} failed: {}",
                           lat_range.first, lat_range.last, lon_range.first, lon_range.last,
                           m_label, nc_strerror(rc));
            return cells;
        }
    }

    // The block follows the variable's own dimension order
    const bool lat_major = m_lat_pos < m_lon_pos;

    cells.reserve(block.size());
    for (std::size_t i = 0; i < lat_range.count(); ++i)
    {
        for (std::size_t j = 0; j < lon_range.count(); ++j)
        {
            const f64 raw = lat_major ? block[i * lon_range.count() + j] : block[j * lat_range.count() + i];
            if (!std::isfinite(raw) || (m_fill && raw == *m_fill) || (m_missing && raw == *m_missing))
            {
                continue;
            }

            const std::size_t lat_index = lat_range.first + i;
            const std::size_t lon_index = lon_range.first + j;
            cells.push_back(ElevationGridCell{
                .latitude   = m_lats[lat_index],
                .longitude  = m_lons[lon_index],
                .elevation  = (raw * m_scale + m_offset) * m_vertical_scale,
                .grid_index = static_cast<u64>(lat_index) * m_lons.size() + lon_index,
            });
        }
    }

    return cells;
}

} // namespace slantcol::terrain
