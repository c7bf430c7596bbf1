#include <catch2/catch.hpp>

#include "mockups.hpp"

#include "core/MaskEvaluator.hpp"

using namespace opendem;

namespace {

RealGrid slope_grid()
{
    RealGrid grid(2, 4);
    grid << 0.0, 10.0, 25.0, 40.0,
            PROCESS_NODATA, 15.0, 30.0, 90.0;
    return grid;
}

MaskThresholds thresholds(std::optional<double> min, std::optional<double> max)
{
    MaskThresholds mask;
    mask.min = min;
    mask.max = max;
    return mask;
}

} // namespace

TEST_CASE("mask bounds are inclusive", "[mask]")
{
    ByteGrid mask = MaskEvaluator::compute_mask(slope_grid(), thresholds(10.0, 30.0));

    ByteGrid expected(2, 4);
    expected << 0, 1, 1, 0,
                0, 1, 1, 0;
    REQUIRE((mask == expected).all());
}

TEST_CASE("one-sided thresholds", "[mask]")
{
    RealGrid const data = slope_grid();

    ByteGrid only_min = MaskEvaluator::compute_mask(data, thresholds(30.0, std::nullopt));
    REQUIRE(only_min.cast<int>().sum() == 3);
    REQUIRE(only_min(0, 3) == 1);
    REQUIRE(only_min(1, 3) == 1);

    ByteGrid only_max = MaskEvaluator::compute_mask(data, thresholds(std::nullopt, 10.0));
    REQUIRE(only_max.cast<int>().sum() == 2);
    REQUIRE(only_max(0, 0) == 1);
}

TEST_CASE("nodata pixels are never inside the mask", "[mask]")
{
    RealGrid const data = slope_grid();

    // Threshold window that contains the nodata value itself
    ByteGrid mask = MaskEvaluator::compute_mask(data, thresholds(-10000.0, 100.0));
    REQUIRE(mask(1, 0) == 0);
    REQUIRE(mask.cast<int>().sum() == 7);
}

TEST_CASE("widening the thresholds never removes pixels", "[mask]")
{
    RealGrid const data = slope_grid();

    ByteGrid narrow = MaskEvaluator::compute_mask(data, thresholds(15.0, 25.0));
    ByteGrid wide = MaskEvaluator::compute_mask(data, thresholds(10.0, 40.0));

    REQUIRE((narrow <= wide).all());
    REQUIRE(narrow.cast<int>().sum() < wide.cast<int>().sum());
}

TEST_CASE("no mask means continuous float output", "[mask]")
{
    FinalGrid grid = MaskEvaluator::evaluate(slope_grid(), std::nullopt);

    REQUIRE_FALSE(grid.binary);
    REQUIRE(grid.pixel_type == PixelType::FLOAT32);
    REQUIRE(grid.nodata == PROCESS_NODATA);
    REQUIRE((grid.values == slope_grid()).all());
    REQUIRE(grid.width() == 4);
    REQUIRE(grid.height() == 2);
}

TEST_CASE("empty mask object is treated as absent", "[mask]")
{
    FinalGrid grid = MaskEvaluator::evaluate(slope_grid(), MaskThresholds{});
    REQUIRE_FALSE(grid.binary);
}

TEST_CASE("mask means binary byte output with nodata zero", "[mask]")
{
    FinalGrid grid = MaskEvaluator::evaluate(slope_grid(), thresholds(20.0, 35.0));

    REQUIRE(grid.binary);
    REQUIRE(grid.pixel_type == PixelType::BYTE);
    REQUIRE(grid.nodata == MASK_NODATA);
    REQUIRE(grid.mask.cast<int>().sum() == 2);
}

TEST_CASE("run reads the process source with its georeferencing", "[mask]")
{
    mock_raster_engine_t engine;
    engine.add_raster("proc.tif", {slope_grid()});

    MaskEvaluator evaluator{engine};
    FinalGrid grid = evaluator.run("proc.tif", thresholds(20.0, 35.0));

    REQUIRE(grid.binary);
    REQUIRE(grid.georef.geotransform == engine.rasters.at("proc.tif").info.geotransform);
    REQUIRE(grid.georef.width == 4);
}

TEST_CASE("dropping the upper bound yields a superset mask", "[mask]")
{
    RealGrid data(3, 3);
    data << 1.0, 5.0, 9.0,
            12.0, PROCESS_NODATA, 50.0,
            0.5, 20.0, 7.5;

    ByteGrid both = MaskEvaluator::compute_mask(data, thresholds(5.0, 15.0));
    ByteGrid only_min = MaskEvaluator::compute_mask(data, thresholds(5.0, std::nullopt));

    REQUIRE((only_min >= both).all());
    REQUIRE(only_min(1, 1) == 0);
}

TEST_CASE("minimum above maximum selects nothing", "[mask]")
{
    FinalGrid grid = MaskEvaluator::evaluate(slope_grid(), thresholds(30.0, 10.0));

    REQUIRE(grid.binary);
    REQUIRE(grid.pixel_type == PixelType::BYTE);
    REQUIRE(grid.mask.rows() == 2);
    REQUIRE(grid.mask.cols() == 4);
    REQUIRE(grid.mask.cast<int>().sum() == 0);
}
