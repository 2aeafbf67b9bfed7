/// @file terrain_loader.cpp
/// @brief ESRI ASCII grid and XYZ CSV terrain loaders, and format dispatch.

#include "terrain/terrain_loader.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace slantcol::terrain
{

std::optional<TerrainFormat> parse_terrain_format(std::string_view text)
{
    if (text == "ascii_grid" || text == "asc")
    {
        return TerrainFormat::AsciiGrid;
    }
    if (text == "xyz_csv" || text == "csv")
    {
        return TerrainFormat::XyzCsv;
    }
    if (text == "netcdf" || text == "nc")
    {
        return TerrainFormat::Netcdf;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// ESRI ASCII grid
// -----------------------------------------------------------------

std::optional<RegularGridSource>
TerrainLoader::load_ascii_grid(const std::filesystem::path& path, f64 vertical_scale)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SLC_CORE_ERROR("TerrainLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::optional<f64> ncols;
    std::optional<f64> nrows;
    std::optional<f64> x_ll;
    std::optional<f64> y_ll;
    std::optional<f64> cellsize;
    f64 nodata = -9999.0;
    bool x_is_center = false;
    bool y_is_center = false;

    // Header: "key value" pairs until the first numeric token
    std::string token;
    while (file >> token)
    {
        if (parse_f64(token))
        {
            break;
        }

        std::string key = token;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::string value_str;
        if (!(file >> value_str))
        {
            SLC_CORE_ERROR("TerrainLoader: Header key '{}' has no value in {}", token, path.string());
            return std::nullopt;
        }

        const auto value = parse_f64(value_str);
        if (!value)
        {
            SLC_CORE_ERROR("TerrainLoader: Bad header value '{} {}' in {}", token, value_str, path.string());
            return std::nullopt;
        }

        if (key == "ncols")             { ncols = value; }
        else if (key == "nrows")        { nrows = value; }
        else if (key == "xllcorner")    { x_ll = value; x_is_center = false; }
        else if (key == "xllcenter")    { x_ll = value; x_is_center = true; }
        else if (key == "yllcorner")    { y_ll = value; y_is_center = false; }
        else if (key == "yllcenter")    { y_ll = value; y_is_center = true; }
        else if (key == "cellsize")     { cellsize = value; }
        else if (key == "nodata_value") { nodata = *value; }
        else
        {
            SLC_CORE_WARN("TerrainLoader: Ignoring unknown header key '{}' in {}", token, path.string());
        }

        token.clear();
    }

    if (!ncols || !nrows || !x_ll || !y_ll || !cellsize)
    {
        SLC_CORE_ERROR("TerrainLoader: Incomplete ASCII grid header in {}", path.string());
        return std::nullopt;
    }

    if (*ncols < 1.0 || *nrows < 1.0 || *cellsize <= 0.0)
    {
        SLC_CORE_ERROR("TerrainLoader: Invalid grid dimensions {}x{} cellsize {} in {}",
                       *nrows, *ncols, *cellsize, path.string());
        return std::nullopt;
    }

    const auto cols = static_cast<u32>(*ncols);
    const auto rows = static_cast<u32>(*nrows);
    const std::size_t expected = static_cast<std::size_t>(rows) * cols;

    std::vector<f64> values;
    values.reserve(expected);

    // `token` already holds the first value when the header loop stopped on it
    if (!token.empty())
    {
        const auto first = parse_f64(token);
        values.push_back(*first == nodata ? nodata : *first * vertical_scale);
    }

    while (values.size() < expected && file >> token)
    {
        const auto value = parse_f64(token);
        if (!value)
        {
            SLC_CORE_ERROR("TerrainLoader: Bad elevation value '{}' at sample {} in {}",
                           token, values.size(), path.string());
            return std::nullopt;
        }
        values.push_back(*value == nodata ? nodata : *value * vertical_scale);
    }

    if (values.size() != expected)
    {
        SLC_CORE_ERROR("TerrainLoader: Expected {} samples, found {} in {}",
                       expected, values.size(), path.string());
        return std::nullopt;
    }

    const f64 half = 0.5 * *cellsize;
    const f64 west_lon = x_is_center ? *x_ll : *x_ll + half;
    const f64 south_lat = y_is_center ? *y_ll : *y_ll + half;
    const f64 north_lat = south_lat + static_cast<f64>(rows - 1) * *cellsize;

    SLC_CORE_INFO("TerrainLoader: Loaded {}x{} grid ({:.5f} deg) from {}",
                  rows, cols, *cellsize, path.string());

    return RegularGridSource(path.filename().string(), north_lat, west_lon, *cellsize,
                             rows, cols, std::move(values), nodata);
}

// -----------------------------------------------------------------
// Scattered samples CSV: lat,lon,elevation
// -----------------------------------------------------------------

std::optional<ScatteredPointSource>
TerrainLoader::load_xyz_csv(const std::filesystem::path& path, f64 vertical_scale)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SLC_CORE_ERROR("TerrainLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::vector<ElevationGridCell> cells;
    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        SLC_CORE_ERROR("TerrainLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string lat_str;
        std::string lon_str;
        std::string elev_str;

        if (!std::getline(stream, lat_str, ',') ||
            !std::getline(stream, lon_str, ',') ||
            !std::getline(stream, elev_str))
        {
            SLC_CORE_WARN("TerrainLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const auto lat  = parse_f64(trim(lat_str));
        const auto lon  = parse_f64(trim(lon_str));
        const auto elev = parse_f64(trim(elev_str));

        if (!lat || !lon || !elev)
        {
            SLC_CORE_WARN("TerrainLoader: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        cells.push_back(ElevationGridCell{
            .latitude   = *lat,
            .longitude  = *lon,
            .elevation  = *elev * vertical_scale,
            .grid_index = 0,
        });
    }

    if (cells.empty())
    {
        SLC_CORE_ERROR("TerrainLoader: No valid samples found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        SLC_CORE_WARN("TerrainLoader: Skipped {} malformed lines", skipped);
    }

    SLC_CORE_INFO("TerrainLoader: Loaded {} samples from {}", cells.size(), path.string());

    return ScatteredPointSource(path.filename().string(), std::move(cells));
}

std::shared_ptr<const ElevationSource>
TerrainLoader::load(const std::filesystem::path& path,
                    TerrainFormat format,
                    f64 vertical_scale,
                    const NetcdfLayout& layout)
{
    switch (format)
    {
        case TerrainFormat::AsciiGrid:
        {
            auto grid = load_ascii_grid(path, vertical_scale);
            if (!grid)
            {
                return nullptr;
            }
            return std::make_shared<const RegularGridSource>(std::move(*grid));
        }
        case TerrainFormat::XyzCsv:
        {
            auto points = load_xyz_csv(path, vertical_scale);
            if (!points)
            {
                return nullptr;
            }
            return std::make_shared<const ScatteredPointSource>(std::move(*points));
        }
        case TerrainFormat::Netcdf:
        {
            return NetcdfGridSource::open(path, layout, vertical_scale);
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view TerrainLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> TerrainLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace slantcol::terrain
