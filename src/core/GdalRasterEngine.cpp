/**
 * @file GdalRasterEngine.cpp
 * @brief GDAL/OGR implementation of the raster engine boundary
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GdalRasterEngine.hpp"
#include "ProgressRelay.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <gdal_priv.h>
#include <gdal_utils.h>
#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>
#include <cpl_error.h>
#include <cpl_string.h>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>

namespace opendem {

namespace {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

using WarpOptionsPtr = std::unique_ptr<GDALWarpAppOptions, decltype(&GDALWarpAppOptionsFree)>;
using DEMOptionsPtr = std::unique_ptr<GDALDEMProcessingOptions, decltype(&GDALDEMProcessingOptionsFree)>;

// Callback data shared by GDALWarp, GDALDEMProcessing and GDALPolygonize
struct ProgressContext {
    ProgressRelay* relay;
    const CancellationToken* cancellation;

    bool active() const { return relay != nullptr || cancellation != nullptr; }
};

// Returning FALSE makes GDAL stop and fail with CPLE_UserInterrupt
int CPL_STDCALL relay_progress(double complete, const char* /*message*/, void* data) {
    auto* context = static_cast<ProgressContext*>(data);
    if (!context) {
        return TRUE;
    }
    if (context->relay) {
        context->relay->report(complete);
    }
    if (context->cancellation && context->cancellation->is_cancelled()) {
        return FALSE;
    }
    return TRUE;
}

std::string format_number(double value) {
    std::ostringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

[[noreturn]] void throw_last_error(const std::string& context) {
    int code = CPLGetLastErrorNo();
    std::string message = CPLGetLastErrorMsg();
    if (message.empty()) {
        throw RasterEngineError(code, context + " failed");
    }
    throw RasterEngineError(code, context + ": " + message);
}

GDALDatasetPtr open_raster(const std::string& path) {
    CPLErrorReset();
    GDALDatasetPtr dataset(GDALDataset::FromHandle(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw_last_error("Opening " + path);
    }
    return dataset;
}

GDALDriver* require_driver(const std::string& name) {
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(name.c_str());
    if (!driver) {
        throw RasterEngineError(CPLE_NotSupported, "GDAL driver not available: " + name);
    }
    return driver;
}

void apply_georeference(GDALDataset* dataset, const RasterInfo& georef) {
    std::array<double, 6> geotransform = georef.geotransform;
    if (dataset->SetGeoTransform(geotransform.data()) != CE_None) {
        throw_last_error("Setting geotransform");
    }
    if (!georef.projection_wkt.empty() &&
        dataset->SetProjection(georef.projection_wkt.c_str()) != CE_None) {
        throw_last_error("Setting projection");
    }
}

} // namespace

GdalRasterEngine::GdalRasterEngine() : logger_("GdalRasterEngine") {
    GDALAllRegister();
}

void GdalRasterEngine::configure_cache(const std::string& cache_dir) {
    std::string absolute = std::filesystem::absolute(cache_dir).string();
    CPLSetConfigOption("GDAL_HTTP_CACHE", "YES");
    CPLSetConfigOption("GDAL_HTTP_CACHE_DIRECTORY", absolute.c_str());
    CPLSetConfigOption("GDAL_DEFAULT_WMS_CACHE_PATH", absolute.c_str());
    logger_.debug("HTTP tile cache directory: " + absolute);
}

void GdalRasterEngine::warp(const WarpRequest& request) {
    CPLStringList args;
    args.AddString("-of");
    args.AddString("GTiff");

    if (request.bounds) {
        args.AddString("-te");
        args.AddString(format_number(request.bounds->min_x).c_str());
        args.AddString(format_number(request.bounds->min_y).c_str());
        args.AddString(format_number(request.bounds->max_x).c_str());
        args.AddString(format_number(request.bounds->max_y).c_str());
        if (!request.bounds_srs.empty()) {
            args.AddString("-te_srs");
            args.AddString(request.bounds_srs.c_str());
        }
    }
    if (request.x_res && request.y_res) {
        args.AddString("-tr");
        args.AddString(format_number(*request.x_res).c_str());
        args.AddString(format_number(*request.y_res).c_str());
    }
    if (!request.dst_srs.empty()) {
        args.AddString("-t_srs");
        args.AddString(request.dst_srs.c_str());
    }
    if (request.cutline) {
        args.AddString("-cutline");
        args.AddString(request.cutline->c_str());
    }
    if (request.crop_to_cutline) {
        args.AddString("-crop_to_cutline");
    }
    if (request.dst_nodata) {
        args.AddString("-dstnodata");
        args.AddString(format_number(*request.dst_nodata).c_str());
    }

    WarpOptionsPtr options(GDALWarpAppOptionsNew(args.List(), nullptr), GDALWarpAppOptionsFree);
    if (!options) {
        throw_last_error("Building warp options");
    }
    ProgressContext context{request.progress, request.cancellation};
    if (context.active()) {
        GDALWarpAppOptionsSetProgress(options.get(), relay_progress, &context);
    }

    GDALDatasetPtr source = open_raster(request.source);
    GDALDatasetH source_handle = GDALDataset::ToHandle(source.get());

    logger_.debug("GDALWarp " + request.source + " -> " + request.destination);

    CPLErrorReset();
    int usage_error = FALSE;
    GDALDatasetPtr result(GDALDataset::FromHandle(
        GDALWarp(request.destination.c_str(), nullptr, 1, &source_handle,
                 options.get(), &usage_error)));
    if (!result) {
        throw_last_error("Warp of " + request.source);
    }
}

void GdalRasterEngine::terrain_derivative(const std::string& destination,
                                          const std::string& source,
                                          const std::string& derivative_name,
                                          const CancellationToken* cancellation) {
    DEMOptionsPtr options(GDALDEMProcessingOptionsNew(nullptr, nullptr), GDALDEMProcessingOptionsFree);
    if (!options) {
        throw_last_error("Building DEM processing options");
    }
    ProgressContext context{nullptr, cancellation};
    if (context.active()) {
        GDALDEMProcessingOptionsSetProgress(options.get(), relay_progress, &context);
    }

    GDALDatasetPtr input = open_raster(source);

    logger_.debug("GDALDEMProcessing " + derivative_name + ": " + source + " -> " + destination);

    CPLErrorReset();
    int usage_error = FALSE;
    GDALDatasetPtr result(GDALDataset::FromHandle(
        GDALDEMProcessing(destination.c_str(), GDALDataset::ToHandle(input.get()), derivative_name.c_str(),
                          nullptr, options.get(), &usage_error)));
    if (!result) {
        throw_last_error("Terrain derivative '" + derivative_name + "'");
    }
}

RasterInfo GdalRasterEngine::describe(const std::string& path) {
    GDALDatasetPtr dataset = open_raster(path);

    RasterInfo info;
    info.width = dataset->GetRasterXSize();
    info.height = dataset->GetRasterYSize();
    info.band_count = dataset->GetRasterCount();
    if (dataset->GetGeoTransform(info.geotransform.data()) != CE_None) {
        logger_.warning("No geotransform on " + path + ", using identity");
    }
    const char* wkt = dataset->GetProjectionRef();
    info.projection_wkt = wkt ? wkt : "";

    return info;
}

RealGrid GdalRasterEngine::read_band(const std::string& path, int band) {
    GDALDatasetPtr dataset = open_raster(path);

    if (band < 1 || band > dataset->GetRasterCount()) {
        throw RasterEngineError(CPLE_IllegalArg,
            "Band " + std::to_string(band) + " out of range for " + path +
            " (" + std::to_string(dataset->GetRasterCount()) + " bands)");
    }

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    RealGrid grid(height, width);

    CPLErrorReset();
    CPLErr err = dataset->GetRasterBand(band)->RasterIO(
        GF_Read, 0, 0, width, height, grid.data(), width, height, GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw_last_error("Reading band " + std::to_string(band) + " of " + path);
    }

    return grid;
}

void GdalRasterEngine::write_raster(const std::string& path, const RealGrid& data,
                                    const RasterInfo& georef, PixelType pixel_type,
                                    std::optional<double> nodata) {
    GDALDriver* gtiff_driver = require_driver("GTiff");

    const int width = static_cast<int>(data.cols());
    const int height = static_cast<int>(data.rows());
    const GDALDataType type = (pixel_type == PixelType::BYTE) ? GDT_Byte : GDT_Float32;

    CPLErrorReset();
    GDALDatasetPtr dataset(gtiff_driver->Create(path.c_str(), width, height, 1, type, nullptr));
    if (!dataset) {
        throw_last_error("Creating raster " + path);
    }

    apply_georeference(dataset.get(), georef);

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (nodata && band->SetNoDataValue(*nodata) != CE_None) {
        throw_last_error("Setting nodata on " + path);
    }

    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height,
                                const_cast<double*>(data.data()), width, height,
                                GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw_last_error("Writing raster " + path);
    }

    dataset->FlushCache();
    logger_.debug("Wrote " + std::to_string(width) + "x" + std::to_string(height) +
                  (type == GDT_Byte ? " Byte" : " Float32") + " raster: " + path);
}

void GdalRasterEngine::remove_vector_dataset(const std::string& path,
                                             const std::string& driver_name) {
    if (!std::filesystem::exists(path)) {
        return;
    }

    GDALDriver* driver = require_driver(driver_name);

    CPLErrorReset();
    if (driver->Delete(path.c_str()) != CE_None) {
        throw_last_error("Deleting existing dataset " + path);
    }
    logger_.debug("Deleted existing dataset: " + path);
}

void GdalRasterEngine::extract_polygons(const PolygonLayerSpec& spec, const ByteGrid& mask,
                                        const RasterInfo& georef, ProgressRelay* progress,
                                        const CancellationToken* cancellation) {
    GDALDriver* memory_driver = require_driver("MEM");
    GDALDriver* vector_driver = require_driver(spec.driver_name);

    const int width = static_cast<int>(mask.cols());
    const int height = static_cast<int>(mask.rows());

    // Stage the mask as an in-memory byte raster, nodata 0
    CPLErrorReset();
    GDALDatasetPtr staging(memory_driver->Create("", width, height, 1, GDT_Byte, nullptr));
    if (!staging) {
        throw_last_error("Creating in-memory mask raster");
    }
    apply_georeference(staging.get(), georef);

    GDALRasterBand* band = staging->GetRasterBand(1);
    CPLErr err = band->RasterIO(GF_Write, 0, 0, width, height,
                                const_cast<std::uint8_t*>(mask.data()), width, height,
                                GDT_Byte, 0, 0);
    if (err != CE_None) {
        throw_last_error("Writing in-memory mask raster");
    }
    if (band->SetNoDataValue(0) != CE_None) {
        throw_last_error("Setting nodata on in-memory mask raster");
    }

    GDALDatasetPtr output(vector_driver->Create(spec.path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!output) {
        throw_last_error("Creating vector dataset " + spec.path);
    }

    OGRSpatialReference srs;
    OGRSpatialReference* layer_srs = nullptr;
    if (!georef.projection_wkt.empty() &&
        srs.importFromWkt(georef.projection_wkt.c_str()) == OGRERR_NONE) {
        layer_srs = &srs;
    }

    OGRLayer* layer = output->CreateLayer(spec.layer_name.c_str(), layer_srs, wkbPolygon, nullptr);
    if (!layer) {
        throw_last_error("Creating layer " + spec.layer_name);
    }

    OGRFieldDefn field(spec.field_name.c_str(), OFTInteger);
    if (layer->CreateField(&field) != OGRERR_NONE) {
        throw_last_error("Creating field " + spec.field_name);
    }

    // Field 0 receives the pixel value; the band is its own mask
    ProgressContext context{progress, cancellation};
    CPLErrorReset();
    err = GDALPolygonize(GDALRasterBand::ToHandle(band), GDALRasterBand::ToHandle(band),
                         OGRLayer::ToHandle(layer), 0, nullptr,
                         relay_progress, &context);
    if (err != CE_None) {
        throw_last_error("Polygonize into " + spec.path);
    }

    logger_.debug("Extracted " + std::to_string(layer->GetFeatureCount()) +
                  " polygons into " + spec.path);
}

} // namespace opendem
