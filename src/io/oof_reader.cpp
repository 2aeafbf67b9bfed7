/// @file oof_reader.cpp
/// @brief EM27 .oof parsing and file selection.

#include "io/oof_reader.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>

namespace
{

using namespace slantcol;

enum Column : std::size_t
{
    kFlag,
    kYear,
    kDay,
    kHour,
    kLat,
    kLon,
    kZobs,
    kColumnCount,
};

constexpr std::array<std::string_view, kColumnCount> kColumnNames = {
    "flag", "year", "day", "hour", "lat(deg)", "long(deg)", "zobs(km)",
};

std::optional<f64> parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> split_whitespace(const std::string& line)
{
    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

/// UTC instant from year, day of year (1-based) and decimal hour.
Timestamp oof_timestamp(i32 year, i32 day_of_year, f64 hour)
{
    const std::chrono::sys_days jan1{std::chrono::year{year} / std::chrono::January / 1};
    const auto seconds = static_cast<i64>(std::llround(hour * 3600.0));
    return Timestamp{jan1} + std::chrono::days{day_of_year - 1} + Seconds{seconds};
}

} // anonymous namespace

namespace slantcol::io
{

// -----------------------------------------------------------------
// Single file
// -----------------------------------------------------------------

std::optional<std::vector<column::ObservationRecord>>
OofReader::read_file(const std::filesystem::path& path, bool filter_flag_zero)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SLC_CORE_ERROR("OofReader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;
    if (!std::getline(file, line))
    {
        SLC_CORE_ERROR("OofReader: File is empty: {}", path.string());
        return std::nullopt;
    }

    const auto first = split_whitespace(line);
    i32 header_lines = 0;
    if (first.empty() ||
        std::from_chars(first[0].data(), first[0].data() + first[0].size(), header_lines).ec != std::errc{} ||
        header_lines < 2)
    {
        SLC_CORE_ERROR("OofReader: Bad header count line in {}: {}", path.string(), line);
        return std::nullopt;
    }

    // Column names sit on the last header line
    u32 line_number = 1;
    while (static_cast<i32>(line_number) < header_lines && std::getline(file, line))
    {
        ++line_number;
    }
    if (static_cast<i32>(line_number) != header_lines)
    {
        SLC_CORE_ERROR("OofReader: {} ends inside its {}-line header", path.string(), header_lines);
        return std::nullopt;
    }

    const auto names = split_whitespace(line);
    std::array<std::size_t, kColumnCount> position{};
    for (std::size_t c = 0; c < kColumnCount; ++c)
    {
        const auto it = std::find(names.begin(), names.end(), kColumnNames[c]);
        if (it == names.end())
        {
            SLC_CORE_ERROR("OofReader: Column '{}' missing in {}", kColumnNames[c], path.string());
            return std::nullopt;
        }
        position[c] = static_cast<std::size_t>(std::distance(names.begin(), it));
    }

    std::vector<column::ObservationRecord> records;
    u32 skipped = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        const auto tokens = split_whitespace(line);
        if (tokens.empty())
        {
            continue;
        }
        if (tokens.size() < names.size())
        {
            SLC_CORE_WARN("OofReader: Short line {} in {}", line_number, path.string());
            ++skipped;
            continue;
        }

        std::array<f64, kColumnCount> values{};
        bool ok = true;
        for (std::size_t c = 0; c < kColumnCount && ok; ++c)
        {
            const auto value = parse_f64(tokens[position[c]]);
            ok = value.has_value();
            if (ok)
            {
                values[c] = *value;
            }
        }
        if (!ok)
        {
            SLC_CORE_WARN("OofReader: Failed to parse values on line {} in {}", line_number, path.string());
            ++skipped;
            continue;
        }

        if (filter_flag_zero && values[kFlag] != 0.0)
        {
            continue;
        }

        records.push_back(column::ObservationRecord{
            .timestamp     = oof_timestamp(static_cast<i32>(values[kYear]),
                                           static_cast<i32>(values[kDay]),
                                           values[kHour]),
            .latitude      = values[kLat],
            .longitude     = values[kLon],
            .elevation_asl = values[kZobs] * 1000.0,
        });
    }

    if (skipped > 0)
    {
        SLC_CORE_WARN("OofReader: Skipped {} malformed lines in {}", skipped, path.string());
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const column::ObservationRecord& a, const column::ObservationRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    SLC_CORE_DEBUG("OofReader: {} records from {}", records.size(), path.string());
    return records;
}

// -----------------------------------------------------------------
// File selection by YYYYMMDD in the name
// -----------------------------------------------------------------

std::vector<std::filesystem::path>
OofReader::files_in_range(const std::filesystem::path& folder, Timestamp start, Timestamp end, Seconds utc_offset)
{
    using std::chrono::days;

    std::vector<std::string> day_strings;
    const auto first_day = std::chrono::floor<days>(start + utc_offset) - days{1};
    const auto last_day = std::chrono::floor<days>(end + utc_offset);
    for (auto day = first_day; day <= last_day; day += days{1})
    {
        day_strings.push_back(astro::TimeSystem::format(Timestamp{day}, "%Y%m%d"));
    }

    std::vector<std::filesystem::path> candidates;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(folder, ec))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".oof")
        {
            candidates.push_back(entry.path());
        }
    }
    if (ec)
    {
        SLC_CORE_ERROR("OofReader: Cannot list {}: {}", folder.string(), ec.message());
        return {};
    }

    std::sort(candidates.begin(), candidates.end());

    std::vector<std::filesystem::path> files;
    for (const auto& candidate : candidates)
    {
        const std::string name = candidate.filename().string();
        const bool match = std::any_of(day_strings.begin(), day_strings.end(),
                                       [&name](const std::string& day) {
                                           return name.find(day) != std::string::npos;
                                       });
        if (match)
        {
            files.push_back(candidate);
        }
    }

    return files;
}

std::optional<std::vector<column::ObservationRecord>>
OofReader::load_range(const std::filesystem::path& folder,
                      Timestamp start,
                      Timestamp end,
                      Seconds utc_offset,
                      bool filter_flag_zero)
{
    if (!std::filesystem::is_directory(folder))
    {
        SLC_CORE_ERROR("OofReader: Observation folder does not exist: {}", folder.string());
        return std::nullopt;
    }

    std::vector<column::ObservationRecord> records;
    for (const auto& path : files_in_range(folder, start, end, utc_offset))
    {
        const auto file_records = read_file(path, filter_flag_zero);
        if (!file_records)
        {
            return std::nullopt;
        }

        std::copy_if(file_records->begin(), file_records->end(), std::back_inserter(records),
                     [start, end](const column::ObservationRecord& r) {
                         return r.timestamp >= start && r.timestamp <= end;
                     });
    }

    std::stable_sort(records.begin(), records.end(),
                     [](const column::ObservationRecord& a, const column::ObservationRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    SLC_CORE_INFO("OofReader: {} observation records between {} and {}", records.size(),
                  astro::TimeSystem::format_iso8601(start), astro::TimeSystem::format_iso8601(end));
    return records;
}

} // namespace slantcol::io
