#pragma once

/// @file oof_reader.hpp
/// @brief Reads EM27 .oof retrieval output into observation records.

#include "column/observation_window.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace slantcol::io
{
    /// @brief Static utility class for EM27 .oof files.
    ///
    /// An .oof file starts with a line whose first integer is the number of
    /// header lines; the last header line names the whitespace-separated
    /// columns. Required columns:
    ///   flag, year, day, hour, lat(deg), long(deg), zobs(km)
    ///
    /// `day` is the day of year, `hour` a decimal UTC hour and `zobs` the
    /// instrument altitude in kilometres.
    class OofReader
    {
    public:
        OofReader() = delete;

        /// @brief Read every record of one file, sorted by time.
        /// @param filter_flag_zero Keep only rows with flag == 0.
        /// @return std::nullopt if the file cannot be read or lacks a required column.
        [[nodiscard]] static std::optional<std::vector<column::ObservationRecord>>
            read_file(const std::filesystem::path& path, bool filter_flag_zero);

        /// @brief .oof files in `folder` whose name carries a YYYYMMDD date from
        /// the day before `start` through the day of `end` (local calendar), in name order.
        [[nodiscard]] static std::vector<std::filesystem::path>
            files_in_range(const std::filesystem::path& folder, Timestamp start, Timestamp end, Seconds utc_offset);

        /// @brief Records from every matching file that fall inside [start, end].
        /// @return std::nullopt on an unreadable folder or file; an empty vector when nothing matches.
        [[nodiscard]] static std::optional<std::vector<column::ObservationRecord>>
            load_range(const std::filesystem::path& folder,
                       Timestamp start,
                       Timestamp end,
                       Seconds utc_offset,
                       bool filter_flag_zero);
    };

} // namespace slantcol::io
