#include <catch2/catch.hpp>

#include "common-cleanup.hpp"
#include "mockups.hpp"

#include "core/CancellationToken.hpp"
#include "export/OutputExporter.hpp"

using namespace opendem;

namespace {

FinalGrid binary_grid()
{
    ByteGrid mask(2, 2);
    mask << 1, 0, 0, 1;
    FinalGrid grid;
    grid.binary = true;
    grid.mask = mask;
    grid.nodata = MASK_NODATA;
    grid.pixel_type = PixelType::BYTE;
    grid.georef = mock_raster_engine_t::make_info(2, 2, 1);
    return grid;
}

FinalGrid continuous_grid()
{
    FinalGrid grid;
    grid.values = RealGrid::Constant(2, 2, 12.5);
    grid.georef = mock_raster_engine_t::make_info(2, 2, 1);
    return grid;
}

} // namespace

TEST_CASE("export branch is chosen by extension", "[export]")
{
    REQUIRE(OutputExporter::select_format("result.gpkg") == ExportFormat::VECTOR);
    REQUIRE(OutputExporter::select_format("dir/RESULT.GPKG") == ExportFormat::VECTOR);
    REQUIRE(OutputExporter::select_format("result.shp") == ExportFormat::VECTOR);
    REQUIRE(OutputExporter::select_format("result.geojson") == ExportFormat::VECTOR);
    REQUIRE(OutputExporter::select_format("result.tif") == ExportFormat::RASTER);
    REQUIRE(OutputExporter::select_format("RESULT.TIF") == ExportFormat::RASTER);
    REQUIRE(OutputExporter::select_format("result") == ExportFormat::RASTER);
    REQUIRE(OutputExporter::select_format("result.gpkg.tif") == ExportFormat::RASTER);

    REQUIRE(OutputExporter::vector_driver_for("a.gpkg") == "GPKG");
    REQUIRE(OutputExporter::vector_driver_for("a.Shp") == "ESRI Shapefile");
    REQUIRE(OutputExporter::vector_driver_for("a.json") == "GeoJSON");
    REQUIRE(OutputExporter::vector_driver_for("a.tif").empty());
}

TEST_CASE("vector output without a mask is rejected", "[export]")
{
    PipelineConfig config;
    config.output = "result.gpkg";
    REQUIRE_THROWS_AS(OutputExporter::check_compatible(config), ProcessingError);

    config.mask = MaskThresholds{};
    REQUIRE_THROWS_AS(OutputExporter::check_compatible(config), ProcessingError);

    config.mask->min = 30.0;
    REQUIRE_NOTHROW(OutputExporter::check_compatible(config));

    config.output = "result.tif";
    config.mask.reset();
    REQUIRE_NOTHROW(OutputExporter::check_compatible(config));
}

TEST_CASE("vector export replaces the dataset and polygonizes the mask", "[export]")
{
    testing::cleanup::dir_t dir{"opendem-export"};
    mock_raster_engine_t engine;
    OutputExporter exporter{engine};

    std::string const output = dir.file("result.gpkg");
    REQUIRE(exporter.run(binary_grid(), output) == ExportFormat::VECTOR);

    REQUIRE(engine.call_log == std::vector<std::string>{"remove_vector_dataset", "extract_polygons"});
    REQUIRE(engine.removed_vectors == std::vector<std::string>{output});
    REQUIRE(engine.polygon_calls.size() == 1);

    auto const &call = engine.polygon_calls.front();
    REQUIRE(call.spec.path == output);
    REQUIRE(call.spec.driver_name == "GPKG");
    REQUIRE(call.spec.layer_name == "mask");
    REQUIRE(call.spec.field_name == "dn");
    REQUIRE(call.mask(0, 0) == 1);
    REQUIRE(call.mask(0, 1) == 0);
    REQUIRE(engine.rasters.count(output) == 0);
}

TEST_CASE("vector export of a continuous grid is refused", "[export]")
{
    mock_raster_engine_t engine;
    OutputExporter exporter{engine};
    REQUIRE_THROWS_AS(exporter.run(continuous_grid(), "result.gpkg"), ProcessingError);
    REQUIRE(engine.call_log.empty());
}

TEST_CASE("raster export writes Byte for masks and Float32 otherwise", "[export]")
{
    testing::cleanup::dir_t dir{"opendem-export"};
    mock_raster_engine_t engine;
    OutputExporter exporter{engine};

    std::string const mask_out = dir.file("mask.tif");
    REQUIRE(exporter.run(binary_grid(), mask_out) == ExportFormat::RASTER);
    auto const &mask_raster = engine.rasters.at(mask_out);
    REQUIRE(mask_raster.pixel_type == PixelType::BYTE);
    REQUIRE(*mask_raster.nodata == MASK_NODATA);
    REQUIRE(mask_raster.bands.front()(1, 1) == 1.0);

    std::string const float_out = dir.file("SLOPE.TIF");
    REQUIRE(exporter.run(continuous_grid(), float_out) == ExportFormat::RASTER);
    auto const &float_raster = engine.rasters.at(float_out);
    REQUIRE(float_raster.pixel_type == PixelType::FLOAT32);
    REQUIRE(*float_raster.nodata == PROCESS_NODATA);
    REQUIRE(float_raster.info.geotransform == continuous_grid().georef.geotransform);

    REQUIRE(engine.polygon_calls.empty());
}

TEST_CASE("an interrupt stops polygonization", "[export]")
{
    testing::cleanup::dir_t dir{"opendem-export"};
    mock_raster_engine_t engine;
    CancellationToken token;
    token.cancel();

    OutputExporter exporter{engine};
    exporter.set_cancellation_token(&token);

    REQUIRE_THROWS_AS(exporter.run(binary_grid(), dir.file("result.gpkg")),
                      OperationCancelled);
    REQUIRE(engine.call_log == std::vector<std::string>{"remove_vector_dataset", "extract_polygons"});
    REQUIRE(engine.interrupted_calls == 1);
    REQUIRE(engine.polygon_calls.empty());
}
