#pragma once

/// @file run_config.hpp
/// @brief Run configuration read from a YAML file.

#include "column/instrument_source.hpp"
#include "column/receptor.hpp"
#include "core/types.hpp"
#include "geodesy/solar_geodesy.hpp"
#include "terrain/terrain_loader.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slantcol::io
{
    /// @brief Instrument mode selected by `column_type`.
    enum class ColumnType : u8
    {
        Ground,  ///< Fixed position from the configuration
        Em27,    ///< Position and coverage from EM27 observation files
    };

    struct TerrainConfig
    {
        std::filesystem::path  path;
        terrain::TerrainFormat format{terrain::TerrainFormat::AsciiGrid};
        f64                    vertical_scale{1.0};
        f64                    subgrid_radius_m{30000.0};
        f64                    bucket_deg{0.01};
        terrain::NetcdfLayout  netcdf{};
    };

    struct ObservationConfig
    {
        std::filesystem::path folder;
        bool                  filter_flag_zero{true};
    };

    /// @brief Everything a run needs, with times already converted to UTC.
    struct RunConfig
    {
        ColumnType                   column_type{ColumnType::Ground};
        std::string                  interval_text{"1h"};
        Seconds                      interval{3600};
        std::string                  timezone{"UTC"};
        Seconds                      utc_offset{0};
        Timestamp                    start{};
        Timestamp                    end{};
        column::InstrumentPosition   instrument{.latitude = 0.0, .longitude = 0.0, .elevation_asl = 0.0};
        std::vector<f64>             heights;
        TerrainConfig                terrain{};
        ObservationConfig            observations{};
        geodesy::SolarGeodesyOptions solar{};
        u32                          workers{1};
        std::filesystem::path        output_folder{"."};

        /// @brief Every contradiction found in the configuration (empty when valid).
        [[nodiscard]] std::vector<std::string> validate() const;

        /// @brief Split [start, end] into per-day windows in the configured timezone.
        ///
        /// The first window starts at `start`, the last ends at `end`, and
        /// every other window covers 00:00:00 to 23:59:59 local time.
        [[nodiscard]] std::vector<column::RunWindow> split_daily_ranges() const;
    };

    /// @brief Static utility class reading RunConfig from YAML.
    ///
    /// Parse errors, type mismatches and validation failures are logged and
    /// reported as std::nullopt.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        [[nodiscard]] static std::optional<RunConfig> load_file(const std::filesystem::path& path);

        [[nodiscard]] static std::optional<RunConfig> load_string(std::string_view yaml);

        /// @brief Parse a cadence such as "1h", "2H", "30min", "5T", "10s" or "1d".
        /// A bare unit means one of it.
        [[nodiscard]] static std::optional<Seconds> parse_cadence(std::string_view text);
    };

} // namespace slantcol::io
