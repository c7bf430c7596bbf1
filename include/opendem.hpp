#pragma once

/**
 * @file opendem.hpp
 * @brief Main header for the opendem terrain derivative generator
 *
 * Fetches Terrarium-encoded elevation tiles through GDAL, decodes them to
 * metric elevation, derives a terrain product (slope, hillshade, ...) and
 * exports either a continuous raster or a thresholded polygon layer.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <optional>
#include <cstdint>
#include <chrono>

// Dense grids
#include <Eigen/Dense>

namespace opendem {

// ============================================================================
// Constants
// ============================================================================

/// Nodata value assigned to process rasters (clipped-away and continuous output)
constexpr double PROCESS_NODATA = -9999.0;

/// Nodata value of the binary mask output (same as "outside mask")
constexpr double MASK_NODATA = 0.0;

/// Default cache directory when the configuration omits one
constexpr const char* DEFAULT_CACHE_DIR = "./cache";

// ============================================================================
// Grid types
// ============================================================================

/// Real-valued single band grid, row-major (row = raster line)
using RealGrid = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Unsigned byte single band grid, row-major
using ByteGrid = Eigen::Array<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Bounding box in geographic coordinates (longitude / latitude)
 */
struct BoundingBox {
    double min_x, min_y, max_x, max_y;

    BoundingBox() : min_x(0.0), min_y(0.0), max_x(0.0), max_y(0.0) {}
    BoundingBox(double minx, double miny, double maxx, double maxy)
        : min_x(minx), min_y(miny), max_x(maxx), max_y(maxy) {}

    double width() const { return max_x - min_x; }
    double height() const { return max_y - min_y; }

    bool is_valid() const { return min_x < max_x && min_y < max_y; }
};

/**
 * @brief Threshold bounds for the binary mask output
 */
struct MaskThresholds {
    std::optional<double> min;
    std::optional<double> max;

    bool empty() const { return !min.has_value() && !max.has_value(); }

    std::string describe() const;
};

/**
 * @brief Pipeline configuration, loaded once from the configuration file
 */
struct PipelineConfig {
    std::string source;                  ///< Tile service URL template
    BoundingBox bounds;                  ///< min_lon, min_lat, max_lon, max_lat
    double resolution = 0.0;             ///< Target pixel size in EPSG:3857 metres
    std::string process;                 ///< Terrain derivative name (slope, hillshade, ...)
    std::string output;                  ///< Output path, extension picks the export branch
    std::optional<std::string> clipping; ///< Polygon boundary path or URL
    std::optional<MaskThresholds> mask;  ///< Present only when a binary mask is wanted
    std::string cache_dir = DEFAULT_CACHE_DIR;

    // Logging
    std::string log_level = "3";
    std::optional<std::string> log_file;
};

/**
 * @brief Min / max summary of a decoded elevation grid
 */
struct ElevationStats {
    double min = 0.0;
    double max = 0.0;
};

/**
 * @brief Export branch chosen from the output path
 */
enum class ExportFormat {
    RASTER,  ///< GeoTIFF grid
    VECTOR   ///< Polygon layer (GeoPackage, Shapefile, GeoJSON)
};

/**
 * @brief Wall-clock duration of one pipeline stage
 */
struct StageTiming {
    std::string name;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Summary of a completed pipeline run
 */
struct PipelineResult {
    std::string output_path;
    ExportFormat format = ExportFormat::RASTER;
    bool binary_mask = false;
    int acquisition_attempts = 0;
    ElevationStats elevation;
    std::vector<StageTiming> stages;
    std::vector<std::string> artifacts;  ///< Intermediate rasters left in the cache
};

/**
 * @brief Version string reported by the command line
 */
const char* version();

} // namespace opendem
