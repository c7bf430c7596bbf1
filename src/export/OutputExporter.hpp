/**
 * @file OutputExporter.hpp
 * @brief Raster or vector export of the final grid, chosen from the output path
 */

#pragma once

#include "opendem.hpp"
#include "../core/Logger.hpp"
#include "../core/MaskEvaluator.hpp"
#include <string>

namespace opendem {

class RasterEngine;
class CancellationToken;

/**
 * @brief Writes the final grid to the configured output
 *
 * Vector extensions (.gpkg, .shp, .geojson, .json) polygonize the binary
 * mask into a layer "mask" with integer field "dn"; every other extension
 * writes a GeoTIFF. Extension matching is case-insensitive.
 */
class OutputExporter {
public:
    static constexpr const char* LAYER_NAME = "mask";
    static constexpr const char* FIELD_NAME = "dn";
    static constexpr const char* RASTER_DRIVER = "GTiff";

    explicit OutputExporter(RasterEngine& engine);

    /**
     * @brief Export branch for an output path
     */
    static ExportFormat select_format(const std::string& output_path);

    /**
     * @brief Vector driver for an output path, empty for raster outputs
     */
    static std::string vector_driver_for(const std::string& output_path);

    /**
     * @brief Reject a vector output without mask thresholds
     * @throws ProcessingError when polygonization would have nothing to trace
     */
    static void check_compatible(const PipelineConfig& config);

    /**
     * @brief Write the grid
     * @param grid Result of MaskEvaluator, carrying the georeferencing
     * @param output_path Destination, replaced if it exists
     * @return Branch taken
     * @throws OperationCancelled when the token is set during polygonization
     */
    ExportFormat run(const FinalGrid& grid, const std::string& output_path);

    void set_cancellation_token(const CancellationToken* token) { token_ = token; }

private:
    RasterEngine& engine_;
    const CancellationToken* token_;
    Logger logger_;

    void export_vector(const FinalGrid& grid, const std::string& output_path);
    void export_raster(const FinalGrid& grid, const std::string& output_path);
};

} // namespace opendem
