/**
 * @file RasterEngine.hpp
 * @brief Boundary to the geospatial processing library
 *
 * The pipeline never touches pixel I/O, warping, terrain derivatives or
 * polygon extraction directly; it goes through this interface. The
 * production binding is GdalRasterEngine. Every call is blocking and
 * reports failure by throwing RasterEngineError. Long running calls take an
 * optional cancellation token; once it is set the engine abandons the call
 * and throws RasterEngineError with CPLE_UserInterrupt.
 */

#pragma once

#include "opendem.hpp"
#include <array>
#include <optional>
#include <string>

namespace opendem {

class ProgressRelay;
class CancellationToken;

/**
 * @brief Pixel data type of a written raster
 */
enum class PixelType {
    BYTE,
    FLOAT32
};

/**
 * @brief Georeferencing and size of an opened raster
 */
struct RasterInfo {
    int width = 0;
    int height = 0;
    int band_count = 0;
    std::array<double, 6> geotransform{{0.0, 1.0, 0.0, 0.0, 0.0, -1.0}};
    std::string projection_wkt;

    double pixel_width() const { return geotransform[1]; }
    double pixel_height() const { return geotransform[5]; }
};

/**
 * @brief Parameters of a warp (reproject, resample, crop) operation
 *
 * Unset optionals are left to the engine's defaults: no target extent keeps
 * the source extent, no resolution keeps the source resolution.
 */
struct WarpRequest {
    std::string destination;
    std::string source;
    std::optional<BoundingBox> bounds;
    std::string bounds_srs;
    std::optional<double> x_res;
    std::optional<double> y_res;
    std::string dst_srs;
    std::optional<std::string> cutline;
    bool crop_to_cutline = false;
    std::optional<double> dst_nodata;
    ProgressRelay* progress = nullptr;
    const CancellationToken* cancellation = nullptr;
};

/**
 * @brief Description of a polygon layer to extract from a byte grid
 */
struct PolygonLayerSpec {
    std::string path;
    std::string driver_name;
    std::string layer_name;
    std::string field_name;
};

/**
 * @brief Abstract raster engine
 */
class RasterEngine {
public:
    virtual ~RasterEngine() = default;

    /**
     * @brief Point the engine's tile-level HTTP cache at a directory
     */
    virtual void configure_cache(const std::string& cache_dir) = 0;

    /**
     * @brief Warp a source into a new raster artifact
     */
    virtual void warp(const WarpRequest& request) = 0;

    /**
     * @brief Compute a single band terrain derivative into a new artifact
     */
    virtual void terrain_derivative(const std::string& destination,
                                    const std::string& source,
                                    const std::string& derivative_name,
                                    const CancellationToken* cancellation) = 0;

    /**
     * @brief Open a raster and return its size and georeferencing
     */
    virtual RasterInfo describe(const std::string& path) = 0;

    /**
     * @brief Read one band (1-based) as real values
     */
    virtual RealGrid read_band(const std::string& path, int band) = 0;

    /**
     * @brief Write a single band GeoTIFF with explicit pixel type
     */
    virtual void write_raster(const std::string& path, const RealGrid& data,
                              const RasterInfo& georef, PixelType pixel_type,
                              std::optional<double> nodata) = 0;

    /**
     * @brief Delete a vector dataset, if one exists at the path
     */
    virtual void remove_vector_dataset(const std::string& path,
                                       const std::string& driver_name) = 0;

    /**
     * @brief Polygonize the non-zero pixels of a byte grid into a new layer
     *
     * The grid is staged as an in-memory byte raster with nodata 0 and used
     * as its own mask, so only value-1 regions become features.
     */
    virtual void extract_polygons(const PolygonLayerSpec& spec, const ByteGrid& mask,
                                  const RasterInfo& georef, ProgressRelay* progress,
                                  const CancellationToken* cancellation) = 0;
};

} // namespace opendem
