#pragma once

/// @file terrain_loader.hpp
/// @brief Reads terrain elevation files into in-memory sources.

#include "core/types.hpp"
#include "terrain/elevation_source.hpp"
#include "terrain/netcdf_grid_source.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace slantcol::terrain
{
    /// @brief Supported on-disk terrain layouts.
    enum class TerrainFormat : u8
    {
        AsciiGrid,  ///< ESRI ASCII raster (.asc)
        XyzCsv,     ///< lat,lon,elevation text samples
        Netcdf,     ///< netCDF raster on 1-D lat/lon coordinates (ASTER GDEM layout)
    };

    /// @brief Map "ascii_grid" / "xyz_csv" / "netcdf" to a format.
    [[nodiscard]] std::optional<TerrainFormat> parse_terrain_format(std::string_view text);

    /// @brief Static utility class for loading terrain datasets.
    class TerrainLoader
    {
    public:
        TerrainLoader() = delete;

        /// @brief Load an ESRI ASCII grid in geographic coordinates.
        ///
        /// Header keys (case-insensitive, any order):
        ///   ncols, nrows, xllcorner|xllcenter, yllcorner|yllcenter,
        ///   cellsize, NODATA_value (optional)
        ///
        /// Values follow in row-major order from the northernmost row.
        ///
        /// @param vertical_scale Multiplier converting stored values to metres.
        /// @return The raster on success, std::nullopt on failure.
        [[nodiscard]] static std::optional<RegularGridSource>
            load_ascii_grid(const std::filesystem::path& path, f64 vertical_scale = 1.0);

        /// @brief Load scattered samples from a CSV with header row.
        ///
        /// Expected CSV columns: lat, lon, elevation
        ///
        /// @param vertical_scale Multiplier converting stored values to metres.
        /// @return The samples on success, std::nullopt on failure.
        [[nodiscard]] static std::optional<ScatteredPointSource>
            load_xyz_csv(const std::filesystem::path& path, f64 vertical_scale = 1.0);

        /// @brief Load any supported format behind the common interface.
        ///
        /// Text formats are read into memory; netCDF files stay open and are
        /// read block by block.
        ///
        /// @param layout Variable and coordinate names, used for netCDF only.
        /// @return nullptr on failure (already logged).
        [[nodiscard]] static std::shared_ptr<const ElevationSource>
            load(const std::filesystem::path& path,
                 TerrainFormat format,
                 f64 vertical_scale = 1.0,
                 const NetcdfLayout& layout = {});

    private:
        [[nodiscard]] static std::string_view trim(std::string_view sv);
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace slantcol::terrain
