/// @file test_receptor_writer.cpp
/// @brief Unit tests for slantcol::io::ReceptorWriter.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "column/receptor.hpp"
#include "core/types.hpp"
#include "io/receptor_writer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace slantcol;
using namespace slantcol::column;
using namespace slantcol::io;
using namespace std::chrono;

// =================================================================
// Fixtures
// =================================================================

static constexpr InstrumentPosition kSlc{.latitude = 40.766, .longitude = -111.847, .elevation_asl = 1492.0};

static Timestamp utc(int y, unsigned m, unsigned d, int hh, int mm = 0, int ss = 0)
{
    return Timestamp{sys_days{year{y} / month{m} / day{d}}} + hours{hh} + minutes{mm} + seconds{ss};
}

static ReceptorTable sample_table()
{
    constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();

    SlantProfile night{.timestamp = utc(2023, 7, 8, 6), .condition = Condition::SolarGeometryUndefined, .points = {
        {.timestamp = utc(2023, 7, 8, 6), .height_above_instrument = 0.0, .latitude = kNaN, .longitude = kNaN,
         .elevation_asl = 1492.0, .surface_elevation = std::nullopt, .height_above_ground_level = std::nullopt,
         .is_above_ground = false, .condition = Condition::SolarGeometryUndefined},
        {.timestamp = utc(2023, 7, 8, 6), .height_above_instrument = 250.0, .latitude = kNaN, .longitude = kNaN,
         .elevation_asl = 1742.0, .surface_elevation = std::nullopt, .height_above_ground_level = std::nullopt,
         .is_above_ground = false, .condition = Condition::SolarGeometryUndefined},
    }};

    SlantProfile day{.timestamp = utc(2023, 7, 8, 18), .condition = Condition::None, .points = {
        {.timestamp = utc(2023, 7, 8, 18), .height_above_instrument = 0.0, .latitude = 40.766,
         .longitude = -111.847, .elevation_asl = 1492.0, .surface_elevation = 1500.0,
         .height_above_ground_level = -8.0, .is_above_ground = false, .condition = Condition::None},
        {.timestamp = utc(2023, 7, 8, 18), .height_above_instrument = 250.0, .latitude = 40.7654321,
         .longitude = -111.8457654, .elevation_asl = 1742.0, .surface_elevation = 1500.0,
         .height_above_ground_level = 242.0, .is_above_ground = true, .condition = Condition::None},
    }};

    std::vector<SlantProfile> profiles;
    profiles.push_back(std::move(night));
    profiles.push_back(std::move(day));

    auto table = ReceptorTable::assemble(std::move(profiles), {0.0, 250.0}, 2);
    REQUIRE(table.has_value());
    return std::move(*table);
}

static std::vector<std::string> lines_of(const std::string& text)
{
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line))
    {
        lines.push_back(line);
    }
    return lines;
}

static const ReceptorFileHeader kHeader{
    .column_type = "ground",
    .instrument  = kSlc,
    .created     = utc(2024, 1, 2, 3, 4, 5),
    .range_start = utc(2023, 7, 8, 6),
    .range_end   = utc(2023, 7, 8, 18),
};

// =================================================================
// CSV body
// =================================================================

TEST_CASE("Header block and CSV rows")
{
    std::ostringstream out;
    ReceptorWriter::write(out, kHeader, sample_table());
    const auto lines = lines_of(out.str());

    REQUIRE(lines.size() == 11);
    CHECK(lines[0] == "Column type: ground");
    CHECK(lines[1] == "Instrument location: lat=40.766000, lon=-111.847000, zasl=1492.00 m");
    CHECK(lines[2] == "Created at: 2024-01-02T03:04:05Z");
    CHECK(lines[3] == "Data date: 2023-07-08");
    CHECK(lines[4] == "Datetime range: 2023-07-08T06:00:00Z to 2023-07-08T18:00:00Z");
    CHECK(lines[5].empty());
    CHECK(lines[6] == "timestamp,height_above_instrument,receptor_lat,receptor_lon,receptor_elevation_asl,"
                      "surface_elevation,height_above_ground_level,is_above_ground,valid,condition");

    SUBCASE("Night rows keep their place with empty geometry")
    {
        CHECK(lines[7] == "2023-07-08T06:00:00Z,0.00,,,1492.00,,,false,false,solar_geometry_undefined");
        CHECK(lines[8] == "2023-07-08T06:00:00Z,250.00,,,1742.00,,,false,false,solar_geometry_undefined");
    }

    SUBCASE("Resolved rows carry every field")
    {
        CHECK(lines[9] == "2023-07-08T18:00:00Z,0.00,40.7660000,-111.8470000,1492.00,1500.00,-8.00,false,true,ok");
        CHECK(lines[10] == "2023-07-08T18:00:00Z,250.00,40.7654321,-111.8457654,1742.00,1500.00,242.00,true,true,ok");
    }
}

TEST_CASE("An empty table still writes the header block")
{
    std::ostringstream out;
    ReceptorWriter::write(out, kHeader, ReceptorTable{});
    CHECK(lines_of(out.str()).size() == 7);
}

// =================================================================
// Files
// =================================================================

TEST_CASE("File name encodes the range start and end times")
{
    CHECK(ReceptorWriter::file_name(utc(2023, 7, 8, 6), utc(2023, 7, 8, 18, 30, 15))
          == "20230708_060000_183015.csv");
}

TEST_CASE("write_file creates the folder and the file")
{
    const std::filesystem::path folder = std::filesystem::temp_directory_path() / "slc_test_writer" / "nested";
    std::filesystem::remove_all(folder.parent_path());

    const auto path = ReceptorWriter::write_file(folder, kHeader, sample_table());

    REQUIRE(path.has_value());
    CHECK(*path == folder / "20230708_060000_180000.csv");
    CHECK(std::filesystem::exists(*path));

    std::ifstream file(*path);
    const std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    CHECK(lines_of(content).size() == 11);

    file.close();
    std::filesystem::remove_all(folder.parent_path());
}
