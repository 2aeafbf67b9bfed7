/// @file run_config.cpp
/// @brief YAML configuration loading and validation.

#include "io/run_config.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>

namespace
{

using namespace slantcol;

/// Optional scalar lookup: keeps `fallback` when the key is absent.
template <typename T>
T value_or(const YAML::Node& node, const char* key, T fallback)
{
    const YAML::Node child = node[key];
    return child ? child.as<T>() : fallback;
}

std::optional<io::RunConfig> from_node(const YAML::Node& root)
{
    io::RunConfig config;

    // --- Mode and cadence ------------------------------------------------
    const std::string column_type = value_or<std::string>(root, "column_type", "ground");
    if (column_type == "ground")
    {
        config.column_type = io::ColumnType::Ground;
    }
    else if (column_type == "em27")
    {
        config.column_type = io::ColumnType::Em27;
    }
    else
    {
        SLC_CORE_ERROR("ConfigLoader: Unknown column_type '{}' (expected ground or em27)", column_type);
        return std::nullopt;
    }

    config.interval_text = value_or<std::string>(root, "interval", config.interval_text);
    const auto interval = io::ConfigLoader::parse_cadence(config.interval_text);
    if (!interval)
    {
        SLC_CORE_ERROR("ConfigLoader: Cannot parse interval '{}'", config.interval_text);
        return std::nullopt;
    }
    config.interval = *interval;

    // --- Time range --------------------------------------------------------
    config.timezone = value_or<std::string>(root, "timezone", config.timezone);
    const auto offset = astro::TimeSystem::parse_utc_offset(config.timezone);
    if (!offset)
    {
        SLC_CORE_ERROR("ConfigLoader: Unsupported timezone '{}' (use UTC or a fixed offset like -07:00)",
                       config.timezone);
        return std::nullopt;
    }
    config.utc_offset = *offset;

    if (!root["start"] || !root["end"])
    {
        SLC_CORE_ERROR("ConfigLoader: 'start' and 'end' are required");
        return std::nullopt;
    }

    const std::string start_text = root["start"].as<std::string>();
    const std::string end_text = root["end"].as<std::string>();
    const auto start = astro::TimeSystem::parse_timestamp(start_text, config.utc_offset);
    const auto end = astro::TimeSystem::parse_timestamp(end_text, config.utc_offset);
    if (!start || !end)
    {
        SLC_CORE_ERROR("ConfigLoader: Cannot parse start '{}' / end '{}'", start_text, end_text);
        return std::nullopt;
    }
    config.start = *start;
    config.end = *end;

    // --- Instrument and heights --------------------------------------------
    if (const YAML::Node inst = root["instrument"])
    {
        config.instrument = column::InstrumentPosition{
            .latitude      = inst["latitude"].as<f64>(),
            .longitude     = inst["longitude"].as<f64>(),
            .elevation_asl = inst["elevation_asl"].as<f64>(),
        };
    }
    else if (config.column_type == io::ColumnType::Ground)
    {
        SLC_CORE_ERROR("ConfigLoader: 'instrument' is required for column_type ground");
        return std::nullopt;
    }

    if (const YAML::Node heights = root["heights_above_instrument"])
    {
        config.heights.reserve(heights.size());
        for (const auto& h : heights)
        {
            config.heights.push_back(h.as<f64>());
        }
    }

    // --- Terrain -------------------------------------------------------------
    if (const YAML::Node terrain = root["terrain"])
    {
        config.terrain.path = value_or<std::string>(terrain, "path", "");

        const std::string format = value_or<std::string>(terrain, "format", "ascii_grid");
        const auto parsed = terrain::parse_terrain_format(format);
        if (!parsed)
        {
            SLC_CORE_ERROR("ConfigLoader: Unknown terrain format '{}'", format);
            return std::nullopt;
        }
        config.terrain.format = *parsed;

        config.terrain.vertical_scale   = value_or(terrain, "vertical_scale", config.terrain.vertical_scale);
        config.terrain.subgrid_radius_m = value_or(terrain, "subgrid_radius_m", config.terrain.subgrid_radius_m);
        config.terrain.bucket_deg       = value_or(terrain, "bucket_deg", config.terrain.bucket_deg);

        config.terrain.netcdf.variable = value_or(terrain, "variable", config.terrain.netcdf.variable);
        config.terrain.netcdf.lat_name = value_or(terrain, "lat_name", config.terrain.netcdf.lat_name);
        config.terrain.netcdf.lon_name = value_or(terrain, "lon_name", config.terrain.netcdf.lon_name);
    }

    // --- Observations ---------------------------------------------------------
    if (const YAML::Node obs = root["observations"])
    {
        config.observations.folder = value_or<std::string>(obs, "folder", "");
        config.observations.filter_flag_zero = value_or(obs, "filter_flag_zero",
                                                        config.observations.filter_flag_zero);
    }

    // --- Solar -----------------------------------------------------------------
    if (const YAML::Node solar = root["solar"])
    {
        config.solar.refraction.enabled = value_or(solar, "apply_refraction", config.solar.refraction.enabled);
        config.solar.refraction.pressure_hpa = value_or(solar, "pressure_hpa", config.solar.refraction.pressure_hpa);
        config.solar.refraction.temperature_c =
            value_or(solar, "temperature_c", config.solar.refraction.temperature_c);
        config.solar.min_elevation_deg = value_or(solar, "min_elevation_deg", config.solar.min_elevation_deg);
    }

    // --- Execution and output --------------------------------------------------
    config.workers = value_or(root, "workers", config.workers);
    if (const YAML::Node output = root["output"])
    {
        config.output_folder = value_or<std::string>(output, "folder", ".");
    }

    return config;
}

} // anonymous namespace

namespace slantcol::io
{

// -----------------------------------------------------------------
// Validation
// -----------------------------------------------------------------

std::vector<std::string> RunConfig::validate() const
{
    std::vector<std::string> problems;

    if (heights.empty())
    {
        problems.emplace_back("heights_above_instrument is empty");
    }
    for (const f64 h : heights)
    {
        if (!std::isfinite(h) || h < 0.0)
        {
            problems.push_back(fmt::format("height above instrument {} m is negative or not finite", h));
        }
    }
    std::vector<f64> sorted = heights;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end())
    {
        problems.emplace_back("heights_above_instrument contains duplicates");
    }

    if (interval <= Seconds{0})
    {
        problems.push_back(fmt::format("interval '{}' must be positive", interval_text));
    }

    if (end < start)
    {
        problems.push_back(fmt::format("end {} is before start {}",
                                       astro::TimeSystem::format_iso8601(end),
                                       astro::TimeSystem::format_iso8601(start)));
    }

    if (column_type == ColumnType::Ground)
    {
        if (std::abs(instrument.latitude) > 90.0 || std::abs(instrument.longitude) > 180.0)
        {
            problems.push_back(fmt::format("instrument position ({}, {}) is out of range",
                                           instrument.latitude, instrument.longitude));
        }
    }
    else if (observations.folder.empty())
    {
        problems.emplace_back("observations.folder is required for column_type em27");
    }

    if (terrain.path.empty())
    {
        problems.emplace_back("terrain.path is required");
    }
    if (terrain.subgrid_radius_m <= 0.0)
    {
        problems.emplace_back("terrain.subgrid_radius_m must be positive");
    }
    if (terrain.bucket_deg <= 0.0)
    {
        problems.emplace_back("terrain.bucket_deg must be positive");
    }
    if (terrain.vertical_scale <= 0.0)
    {
        problems.emplace_back("terrain.vertical_scale must be positive");
    }
    if (terrain.format == terrain::TerrainFormat::Netcdf
        && (terrain.netcdf.variable.empty() || terrain.netcdf.lat_name.empty() || terrain.netcdf.lon_name.empty()))
    {
        problems.emplace_back("terrain.variable, terrain.lat_name and terrain.lon_name must not be empty");
    }

    return problems;
}

// -----------------------------------------------------------------
// Daily split (local calendar days)
// -----------------------------------------------------------------

std::vector<column::RunWindow> RunConfig::split_daily_ranges() const
{
    using std::chrono::days;

    std::vector<column::RunWindow> windows;
    if (end < start)
    {
        SLC_CORE_ERROR("RunConfig: End datetime is before start datetime");
        return windows;
    }

    const Timestamp local_start = start + utc_offset;
    const Timestamp local_end = end + utc_offset;
    const auto first_day = std::chrono::floor<days>(local_start);
    const auto last_day = std::chrono::floor<days>(local_end);

    for (auto day = first_day; day <= last_day; day += days{1})
    {
        const Timestamp day_begin = Timestamp{day} - utc_offset;
        const Timestamp day_last_second = Timestamp{day} + days{1} - Seconds{1} - utc_offset;

        windows.push_back(column::RunWindow{
            .start = (day == first_day) ? start : day_begin,
            .end   = (day == last_day) ? end : day_last_second,
        });
    }

    return windows;
}

// -----------------------------------------------------------------
// Loading
// -----------------------------------------------------------------

std::optional<RunConfig> ConfigLoader::load_file(const std::filesystem::path& path)
{
    std::optional<RunConfig> config;
    try
    {
        config = from_node(YAML::LoadFile(path.string()));
    }
    catch (const YAML::Exception& e)
    {
        SLC_CORE_ERROR("ConfigLoader: Failed to read {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    if (!config)
    {
        return std::nullopt;
    }

    const auto problems = config->validate();
    for (const auto& problem : problems)
    {
        SLC_CORE_ERROR("ConfigLoader: {}: {}", path.string(), problem);
    }
    if (!problems.empty())
    {
        return std::nullopt;
    }

    SLC_CORE_INFO("ConfigLoader: Loaded {}", path.string());
    return config;
}

std::optional<RunConfig> ConfigLoader::load_string(std::string_view yaml)
{
    std::optional<RunConfig> config;
    try
    {
        config = from_node(YAML::Load(std::string(yaml)));
    }
    catch (const YAML::Exception& e)
    {
        SLC_CORE_ERROR("ConfigLoader: Failed to parse configuration: {}", e.what());
        return std::nullopt;
    }

    if (!config)
    {
        return std::nullopt;
    }

    const auto problems = config->validate();
    for (const auto& problem : problems)
    {
        SLC_CORE_ERROR("ConfigLoader: {}", problem);
    }
    if (!problems.empty())
    {
        return std::nullopt;
    }

    return config;
}

// -----------------------------------------------------------------
// Cadence: <count><unit>, unit in d | h/H | min/T | s/S
// -----------------------------------------------------------------

std::optional<Seconds> ConfigLoader::parse_cadence(std::string_view text)
{
    while (!text.empty() && text.front() == ' ')
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ')
    {
        text.remove_suffix(1);
    }

    std::size_t digits = 0;
    while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9')
    {
        ++digits;
    }

    i64 count = 1;
    if (digits > 0)
    {
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + digits, count);
        if (ec != std::errc{})
        {
            return std::nullopt;
        }
    }

    const std::string_view unit = text.substr(digits);
    i64 unit_seconds = 0;
    if (unit == "d" || unit == "D")
    {
        unit_seconds = 86400;
    }
    else if (unit == "h" || unit == "H")
    {
        unit_seconds = 3600;
    }
    else if (unit == "min" || unit == "T")
    {
        unit_seconds = 60;
    }
    else if (unit == "s" || unit == "S")
    {
        unit_seconds = 1;
    }
    else
    {
        return std::nullopt;
    }

    if (count <= 0 || count > std::numeric_limits<i64>::max() / unit_seconds)
    {
        return std::nullopt;
    }

    return Seconds{count * unit_seconds};
}

} // namespace slantcol::io
