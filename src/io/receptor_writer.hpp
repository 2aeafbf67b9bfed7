#pragma once

/// @file receptor_writer.hpp
/// @brief Writes a ReceptorTable as CSV with a short metadata header.

#include "column/receptor.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace slantcol::io
{
    /// @brief Descriptive lines written above the CSV body.
    struct ReceptorFileHeader
    {
        std::string                column_type;
        column::InstrumentPosition instrument;
        Timestamp                  created;
        Timestamp                  range_start;
        Timestamp                  range_end;
    };

    /// @brief Static utility class serializing receptor tables.
    ///
    /// Layout: metadata lines, one blank line, then a CSV header row and one
    /// row per (timestamp, height):
    ///   timestamp, height_above_instrument, receptor_lat, receptor_lon,
    ///   receptor_elevation_asl, surface_elevation, height_above_ground_level,
    ///   is_above_ground, valid, condition
    ///
    /// Missing values (no solar geometry, unresolved ground level) are written empty.
    class ReceptorWriter
    {
    public:
        ReceptorWriter() = delete;

        static void write(std::ostream& out, const ReceptorFileHeader& header, const column::ReceptorTable& table);

        /// @brief Write into `folder` under file_name(); creates the folder if needed.
        /// @return The written path, or std::nullopt on I/O failure.
        [[nodiscard]] static std::optional<std::filesystem::path> write_file(const std::filesystem::path& folder,
                                                                             const ReceptorFileHeader& header,
                                                                             const column::ReceptorTable& table);

        /// @brief "YYYYmmdd_HHMMSS_HHMMSS.csv" from the range start and end (UTC).
        [[nodiscard]] static std::string file_name(Timestamp range_start, Timestamp range_end);
    };

} // namespace slantcol::io
