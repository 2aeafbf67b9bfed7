/// @file test_elevation_index.cpp
/// @brief Unit tests for slantcol::terrain::ElevationIndex and the in-memory sources.
///
/// Verifies exact-cell lookups, equidistant tie-breaking, coverage gaps and
/// agreement of the bucketed search with a brute-force scan.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/types.hpp"
#include "geodesy/geodesic.hpp"
#include "terrain/elevation_index.hpp"
#include "terrain/elevation_source.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <vector>

using namespace slantcol;
using namespace slantcol::terrain;

// =================================================================
// Helpers
// =================================================================

/// 21 x 21 raster at 0.005° around (40.75, -111.85), elevation = 1000 + row * 10 + col
static std::shared_ptr<const RegularGridSource> make_raster(f64 nodata_at = -1.0)
{
    constexpr u32 kSize = 21;
    std::vector<f64> values(kSize * kSize);
    for (u32 r = 0; r < kSize; ++r)
    {
        for (u32 c = 0; c < kSize; ++c)
        {
            values[r * kSize + c] = 1000.0 + r * 10.0 + c;
        }
    }
    if (nodata_at >= 0.0)
    {
        values[static_cast<std::size_t>(nodata_at)] = -9999.0;
    }
    return std::make_shared<const RegularGridSource>("test raster", 40.80, -111.90, 0.005, kSize, kSize,
                                                     std::move(values), -9999.0);
}

static ElevationLookup brute_force(const std::vector<ElevationGridCell>& cells, f64 lat, f64 lon)
{
    f64 best_dist = std::numeric_limits<f64>::infinity();
    const ElevationGridCell* best = nullptr;
    for (const auto& cell : cells)
    {
        const f64 d = geodesy::Geodesic::haversine_distance(
            geodesy::GeoPoint{.latitude = lat, .longitude = lon},
            geodesy::GeoPoint{.latitude = cell.latitude, .longitude = cell.longitude});
        if (d < best_dist || (d == best_dist && cell.grid_index < best->grid_index))
        {
            best_dist = d;
            best = &cell;
        }
    }
    return ElevationLookup{
        .condition  = Condition::None,
        .elevation  = best->elevation,
        .distance_m = best_dist,
        .grid_index = best->grid_index,
    };
}

// =================================================================
// Sources
// =================================================================

TEST_CASE("RegularGridSource enumerates valid cells in row-major order")
{
    const auto raster = make_raster(5.0);

    const auto cells = raster->cells_within(raster->extent());
    CHECK(cells.size() == 21u * 21u - 1u);

    for (std::size_t i = 1; i < cells.size(); ++i)
    {
        CHECK(cells[i - 1].grid_index < cells[i].grid_index);
    }

    CHECK(cells[0].latitude == doctest::Approx(40.80));
    CHECK(cells[0].longitude == doctest::Approx(-111.90));
    CHECK(cells[0].elevation == 1000.0);
    CHECK(cells[5].grid_index == 6);  // index 5 is nodata
}

TEST_CASE("RegularGridSource extent covers half a cell beyond the outer centres")
{
    const auto raster = make_raster();
    const GeoBounds extent = raster->extent();

    CHECK(extent.max_lat == doctest::Approx(40.8025));
    CHECK(extent.min_lat == doctest::Approx(40.80 - 20 * 0.005 - 0.0025));
    CHECK(extent.min_lon == doctest::Approx(-111.9025));
    CHECK(extent.max_lon == doctest::Approx(-111.90 + 20 * 0.005 + 0.0025));
}

TEST_CASE("ScatteredPointSource renumbers samples and reports its extent")
{
    const ScatteredPointSource source("pts", {
        {.latitude = 1.0, .longitude = 2.0, .elevation = 10.0, .grid_index = 77},
        {.latitude = -1.0, .longitude = 3.0, .elevation = 20.0, .grid_index = 12},
    });

    const auto cells = source.cells_within(source.extent());
    REQUIRE(cells.size() == 2);
    CHECK(cells[0].grid_index == 0);
    CHECK(cells[1].grid_index == 1);
    CHECK(source.extent().min_lat == -1.0);
    CHECK(source.extent().max_lon == 3.0);
}

TEST_CASE("GeoBounds helpers")
{
    const GeoBounds box = GeoBounds::around(40.0, -111.0, 10000.0);
    CHECK(box.contains(40.0, -111.0));
    CHECK(box.max_lat - 40.0 == doctest::Approx(10000.0 / earth_constants::kMetresPerDeg));
    CHECK(box.max_lon - (-111.0) > box.max_lat - 40.0);

    const GeoBounds other{.min_lat = 50.0, .max_lat = 51.0, .min_lon = 0.0, .max_lon = 1.0};
    CHECK(box.intersect(other).empty());
}

// =================================================================
// Nearest elevation
// =================================================================

TEST_CASE("Lookup at a cell's exact coordinates returns that cell's elevation")
{
    ElevationIndex index(make_raster());
    const auto& cells = index.load_subgrid(40.75, -111.85, 20000.0);
    REQUIRE(cells.size() == 21u * 21u);

    for (const auto& cell : cells)
    {
        const auto lookup = index.nearest_elevation(cell.latitude, cell.longitude);
        REQUIRE(lookup.found());
        CHECK(lookup.elevation == cell.elevation);
        CHECK(lookup.grid_index == cell.grid_index);
        CHECK(lookup.distance_m == 0.0);
    }
}

TEST_CASE("Equidistant samples resolve to the lowest grid index")
{
    auto source = std::make_shared<const ScatteredPointSource>("tie", std::vector<ElevationGridCell>{
        {.latitude = 0.0, .longitude = 0.01, .elevation = 100.0, .grid_index = 0},
        {.latitude = 0.0, .longitude = -0.01, .elevation = 200.0, .grid_index = 0},
        {.latitude = 0.01, .longitude = 0.0, .elevation = 300.0, .grid_index = 0},
        {.latitude = -0.01, .longitude = 0.0, .elevation = 400.0, .grid_index = 0},
    });

    ElevationIndex index(source, 0.002);
    index.load_subgrid(0.0, 0.0, 5000.0);

    // Four samples at the same distance from the centre
    const auto lookup = index.nearest_elevation(0.0, 0.0);
    REQUIRE(lookup.found());
    CHECK(lookup.grid_index == 0);
    CHECK(lookup.elevation == 100.0);
}

TEST_CASE("Tie-break follows grid index, not listing position")
{
    const ElevationGridCell north{.latitude = 0.01, .longitude = 0.0, .elevation = 300.0, .grid_index = 0};
    const ElevationGridCell south{.latitude = -0.01, .longitude = 0.0, .elevation = 400.0, .grid_index = 0};

    ElevationIndex north_first(std::make_shared<const ScatteredPointSource>(
        "north first", std::vector<ElevationGridCell>{north, south}));
    ElevationIndex south_first(std::make_shared<const ScatteredPointSource>(
        "south first", std::vector<ElevationGridCell>{south, north}));
    north_first.load_subgrid(0.0, 0.0, 5000.0);
    south_first.load_subgrid(0.0, 0.0, 5000.0);

    CHECK(north_first.nearest_elevation(0.0, 0.0).elevation == 300.0);
    CHECK(south_first.nearest_elevation(0.0, 0.0).elevation == 400.0);
}

TEST_CASE("Lookups outside the dataset report CoverageGap")
{
    ElevationIndex index(make_raster());

    SUBCASE("Point beyond the dataset edge")
    {
        index.load_subgrid(40.75, -111.85, 20000.0);
        const auto lookup = index.nearest_elevation(41.5, -111.85);
        CHECK(lookup.condition == Condition::CoverageGap);
        CHECK_FALSE(lookup.found());
        CHECK(std::isnan(lookup.elevation));
    }

    SUBCASE("Subgrid centred far away loads nothing")
    {
        const auto& cells = index.load_subgrid(-33.9, 151.2, 10000.0);
        CHECK(cells.empty());
        CHECK(index.nearest_elevation(-33.9, 151.2).condition == Condition::CoverageGap);
    }
}

TEST_CASE("Lookups inside the dataset but outside the subgrid are read from the source")
{
    const auto raster = make_raster();
    const auto all_cells = raster->cells_within(raster->extent());

    ElevationIndex index(raster);

    SUBCASE("Nothing loaded yet")
    {
        CHECK_FALSE(index.loaded());
        const auto lookup = index.nearest_elevation(40.75, -111.85);
        REQUIRE(lookup.found());
        CHECK(lookup.grid_index == brute_force(all_cells, 40.75, -111.85).grid_index);
    }

    SUBCASE("Small subgrid in one corner, queries across the raster")
    {
        index.load_subgrid(40.80, -111.90, 600.0);
        REQUIRE(index.loaded());
        REQUIRE(index.cells().size() < all_cells.size());

        for (const f64 lat : {40.7012, 40.7333, 40.7791})
        {
            for (const f64 lon : {-111.8987, -111.8502, -111.8013})
            {
                CAPTURE(lat);
                CAPTURE(lon);
                REQUIRE_FALSE(index.loaded_extent().contains(lat, lon));

                const auto lookup = index.nearest_elevation(lat, lon);
                const auto expected = brute_force(all_cells, lat, lon);
                REQUIRE(lookup.found());
                CHECK(lookup.grid_index == expected.grid_index);
                CHECK(lookup.elevation == expected.elevation);
                CHECK(lookup.distance_m == doctest::Approx(expected.distance_m));
            }
        }
    }
}

TEST_CASE("Low-sun receptor beyond the subgrid radius still gets a surface elevation")
{
    // Uniform 1500 m DEM spanning 2° x 2° around Salt Lake City at 0.01°
    constexpr u32 kSize = 201;
    auto dem = std::make_shared<const RegularGridSource>("wide dem", 41.766, -112.847, 0.01, kSize, kSize,
                                                         std::vector<f64>(kSize * kSize, 1500.0), -9999.0);

    ElevationIndex index(dem);
    index.load_subgrid(40.766, -111.847, 30000.0);

    // About 50 km east-northeast of the instrument, as for a 2250 m receptor at ~2.6° solar elevation
    const f64 lat = 40.9068;
    const f64 lon = -111.2800;
    REQUIRE_FALSE(index.loaded_extent().contains(lat, lon));
    REQUIRE(dem->extent().contains(lat, lon));

    const auto lookup = index.nearest_elevation(lat, lon);
    REQUIRE(lookup.found());
    CHECK(lookup.elevation == 1500.0);
    CHECK(lookup.distance_m < 1000.0);
}

TEST_CASE("Scattered samples outside the subgrid match a scan of the source")
{
    std::mt19937 rng(7);
    std::uniform_real_distribution<f64> lat_dist(40.0, 41.5);
    std::uniform_real_distribution<f64> lon_dist(-112.5, -111.0);
    std::uniform_real_distribution<f64> elev_dist(1200.0, 3000.0);

    std::vector<ElevationGridCell> samples;
    for (u32 i = 0; i < 300; ++i)
    {
        samples.push_back({.latitude = lat_dist(rng), .longitude = lon_dist(rng),
                           .elevation = elev_dist(rng), .grid_index = 0});
    }
    auto scattered = std::make_shared<const ScatteredPointSource>("sparse", std::move(samples));
    const auto all_cells = scattered->cells_within(scattered->extent());

    ElevationIndex index(scattered);
    index.load_subgrid(40.766, -111.847, 5000.0);

    for (u32 q = 0; q < 100; ++q)
    {
        const f64 lat = lat_dist(rng);
        const f64 lon = lon_dist(rng);
        if (index.loaded_extent().contains(lat, lon) || !scattered->extent().contains(lat, lon))
        {
            continue;
        }

        const auto lookup = index.nearest_elevation(lat, lon);
        REQUIRE(lookup.found());
        CHECK(lookup.grid_index == brute_force(all_cells, lat, lon).grid_index);
    }
}

TEST_CASE("Subgrid radius limits the loaded cells")
{
    ElevationIndex index(make_raster());
    const auto& cells = index.load_subgrid(40.75, -111.85, 1000.0);

    CHECK_FALSE(cells.empty());
    CHECK(cells.size() < 21u * 21u);
    for (const auto& cell : cells)
    {
        CHECK(index.loaded_extent().contains(cell.latitude, cell.longitude));
    }
}

TEST_CASE("Bucketed search matches a brute-force scan")
{
    std::mt19937 rng(20230708);
    std::uniform_real_distribution<f64> lat_dist(40.69, 40.81);
    std::uniform_real_distribution<f64> lon_dist(-111.91, -111.79);
    std::uniform_real_distribution<f64> elev_dist(1200.0, 3000.0);

    std::vector<ElevationGridCell> samples;
    for (u32 i = 0; i < 500; ++i)
    {
        samples.push_back({.latitude = lat_dist(rng), .longitude = lon_dist(rng),
                           .elevation = elev_dist(rng), .grid_index = 0});
    }
    auto scattered = std::make_shared<const ScatteredPointSource>("random", std::move(samples));

    for (const f64 bucket : {0.001, 0.01, 0.5})
    {
        CAPTURE(bucket);
        ElevationIndex index(scattered, bucket);
        const auto& cells = index.load_subgrid(40.75, -111.85, 20000.0);
        REQUIRE(cells.size() == 500);

        for (u32 q = 0; q < 200; ++q)
        {
            const f64 lat = lat_dist(rng);
            const f64 lon = lon_dist(rng);
            if (!index.loaded_extent().contains(lat, lon))
            {
                continue;
            }

            const auto fast = index.nearest_elevation(lat, lon);
            const auto slow = brute_force(cells, lat, lon);
            REQUIRE(fast.found());
            CHECK(fast.grid_index == slow.grid_index);
            CHECK(fast.elevation == slow.elevation);
        }
    }
}

TEST_CASE("Scattered and raster sources agree at raster cell centres")
{
    const auto raster = make_raster();
    auto scattered = std::make_shared<const ScatteredPointSource>("copy", raster->cells_within(raster->extent()));

    ElevationIndex from_raster(raster);
    ElevationIndex from_points(scattered);
    from_raster.load_subgrid(40.75, -111.85, 20000.0);
    from_points.load_subgrid(40.75, -111.85, 20000.0);

    for (const f64 lat : {40.7012, 40.7333, 40.7791})
    {
        for (const f64 lon : {-111.8987, -111.8502, -111.8013})
        {
            CHECK(from_raster.nearest_elevation(lat, lon).elevation
                  == from_points.nearest_elevation(lat, lon).elevation);
        }
    }
}
