/**
 * @file OutputExporter.cpp
 * @brief Implementation of the output exporter
 */

#include "OutputExporter.hpp"
#include "../core/CancellationToken.hpp"
#include "../core/Errors.hpp"
#include "../core/ProgressRelay.hpp"
#include "../core/RasterEngine.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace opendem {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

const std::map<std::string, std::string>& vector_drivers() {
    static const std::map<std::string, std::string> drivers = {
        {".gpkg", "GPKG"},
        {".shp", "ESRI Shapefile"},
        {".geojson", "GeoJSON"},
        {".json", "GeoJSON"}
    };
    return drivers;
}

} // namespace

OutputExporter::OutputExporter(RasterEngine& engine)
    : engine_(engine), token_(nullptr), logger_("OutputExporter") {
}

ExportFormat OutputExporter::select_format(const std::string& output_path) {
    return vector_driver_for(output_path).empty() ? ExportFormat::RASTER : ExportFormat::VECTOR;
}

std::string OutputExporter::vector_driver_for(const std::string& output_path) {
    auto it = vector_drivers().find(lower_extension(output_path));
    if (it == vector_drivers().end()) {
        return "";
    }
    return it->second;
}

void OutputExporter::check_compatible(const PipelineConfig& config) {
    const bool has_mask = config.mask && !config.mask->empty();
    if (select_format(config.output) == ExportFormat::VECTOR && !has_mask) {
        throw ProcessingError("Vector output '" + config.output +
                              "' requires mask thresholds; polygonizing a continuous grid is not supported");
    }
}

ExportFormat OutputExporter::run(const FinalGrid& grid, const std::string& output_path) {
    const ExportFormat format = select_format(output_path);

    std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw ResourceError("Cannot create output directory " + parent.string() + ": " + ec.message());
        }
    }

    if (format == ExportFormat::VECTOR) {
        if (!grid.binary) {
            throw ProcessingError("Vector output '" + output_path + "' requires a binary mask");
        }
        export_vector(grid, output_path);
    } else {
        export_raster(grid, output_path);
    }

    return format;
}

void OutputExporter::export_vector(const FinalGrid& grid, const std::string& output_path) {
    logger_.info("Exporting to Vector format: " + output_path);

    PolygonLayerSpec spec;
    spec.path = output_path;
    spec.driver_name = vector_driver_for(output_path);
    spec.layer_name = LAYER_NAME;
    spec.field_name = FIELD_NAME;

    logger_.debug("Vector driver: " + spec.driver_name);

    // The vector drivers refuse to create over an existing dataset
    engine_.remove_vector_dataset(output_path, spec.driver_name);

    ProgressRelay progress("Polygonize Progress", logger_);
    try {
        engine_.extract_polygons(spec, grid.mask, grid.georef, &progress, token_);
    } catch (const RasterEngineError&) {
        if (token_) {
            token_->throw_if_cancelled("polygonize");
        }
        throw;
    }
}

void OutputExporter::export_raster(const FinalGrid& grid, const std::string& output_path) {
    logger_.info("Exporting to Raster format: " + output_path);

    if (grid.binary) {
        RealGrid values = grid.mask.cast<double>();
        engine_.write_raster(output_path, values, grid.georef, PixelType::BYTE, MASK_NODATA);
    } else {
        engine_.write_raster(output_path, grid.values, grid.georef, PixelType::FLOAT32, PROCESS_NODATA);
    }
}

} // namespace opendem
