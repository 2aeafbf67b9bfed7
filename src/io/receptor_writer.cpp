/// @file receptor_writer.cpp
/// @brief Receptor table CSV output.

#include "io/receptor_writer.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <fstream>
#include <system_error>

namespace
{

using namespace slantcol;

std::string number_or_empty(f64 value, int precision)
{
    return std::isfinite(value) ? fmt::format("{:.{}f}", value, precision) : std::string{};
}

std::string number_or_empty(const std::optional<f64>& value, int precision)
{
    return value ? number_or_empty(*value, precision) : std::string{};
}

} // anonymous namespace

namespace slantcol::io
{

void ReceptorWriter::write(std::ostream& out, const ReceptorFileHeader& header, const column::ReceptorTable& table)
{
    using astro::TimeSystem;

    out << "Column type: " << header.column_type << '\n';
    out << fmt::format("Instrument location: lat={:.6f}, lon={:.6f}, zasl={:.2f} m\n",
                       header.instrument.latitude, header.instrument.longitude, header.instrument.elevation_asl);
    out << "Created at: " << TimeSystem::format_iso8601(header.created) << '\n';
    out << "Data date: " << TimeSystem::format(header.range_start, "%Y-%m-%d") << '\n';
    out << "Datetime range: " << TimeSystem::format_iso8601(header.range_start) << " to "
        << TimeSystem::format_iso8601(header.range_end) << '\n';
    out << '\n';

    out << "timestamp,height_above_instrument,receptor_lat,receptor_lon,receptor_elevation_asl,"
           "surface_elevation,height_above_ground_level,is_above_ground,valid,condition\n";

    for (const column::ReceptorPoint& row : table.rows())
    {
        out << TimeSystem::format_iso8601(row.timestamp) << ','
            << number_or_empty(row.height_above_instrument, 2) << ','
            << number_or_empty(row.latitude, 7) << ','
            << number_or_empty(row.longitude, 7) << ','
            << number_or_empty(row.elevation_asl, 2) << ','
            << number_or_empty(row.surface_elevation, 2) << ','
            << number_or_empty(row.height_above_ground_level, 2) << ','
            << (row.is_above_ground ? "true" : "false") << ','
            << (row.valid() ? "true" : "false") << ','
            << to_string(row.condition) << '\n';
    }
}

std::optional<std::filesystem::path> ReceptorWriter::write_file(const std::filesystem::path& folder,
                                                                const ReceptorFileHeader& header,
                                                                const column::ReceptorTable& table)
{
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec)
    {
        SLC_CORE_ERROR("ReceptorWriter: Cannot create {}: {}", folder.string(), ec.message());
        return std::nullopt;
    }

    const std::filesystem::path path = folder / file_name(header.range_start, header.range_end);
    std::ofstream file(path);
    if (!file.is_open())
    {
        SLC_CORE_ERROR("ReceptorWriter: Failed to open {} for writing", path.string());
        return std::nullopt;
    }

    write(file, header, table);
    file.flush();
    if (!file)
    {
        SLC_CORE_ERROR("ReceptorWriter: Write to {} failed", path.string());
        return std::nullopt;
    }

    SLC_CORE_INFO("ReceptorWriter: Wrote {} rows to {}", table.size(), path.string());
    return path;
}

std::string ReceptorWriter::file_name(Timestamp range_start, Timestamp range_end)
{
    return astro::TimeSystem::format(range_start, "%Y%m%d_%H%M%S")
         + astro::TimeSystem::format(range_end, "_%H%M%S")
         + ".csv";
}

} // namespace slantcol::io
