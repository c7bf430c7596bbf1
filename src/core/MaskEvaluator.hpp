/**
 * @file MaskEvaluator.hpp
 * @brief Continuous vs binary output decision and threshold masking
 */

#pragma once

#include "opendem.hpp"
#include "Logger.hpp"
#include "RasterEngine.hpp"
#include <optional>
#include <string>

namespace opendem {

/**
 * @brief Grid handed to the exporter, with its type and nodata convention
 */
struct FinalGrid {
    bool binary = false;
    RealGrid values;     ///< Continuous values, used when !binary
    ByteGrid mask;       ///< 0/1 values, used when binary
    double nodata = PROCESS_NODATA;
    PixelType pixel_type = PixelType::FLOAT32;
    RasterInfo georef;

    int width() const { return static_cast<int>(binary ? mask.cols() : values.cols()); }
    int height() const { return static_cast<int>(binary ? mask.rows() : values.rows()); }
};

/**
 * @brief Builds the export grid from the process source raster
 *
 * Without thresholds the data passes through unchanged (Float32, nodata
 * -9999). With thresholds every pixel becomes 1 where min <= value <= max
 * (each bound optional) and the value is not the process nodata, else 0.
 * The binary grid uses nodata 0, so nodata and "outside mask" are the same
 * class downstream.
 */
class MaskEvaluator {
public:
    explicit MaskEvaluator(RasterEngine& engine);

    /**
     * @brief Compute the binary mask of a grid
     */
    static ByteGrid compute_mask(const RealGrid& data, const MaskThresholds& thresholds,
                                 double nodata = PROCESS_NODATA);

    /**
     * @brief Decide continuous vs binary for in-memory data
     */
    static FinalGrid evaluate(const RealGrid& data, const std::optional<MaskThresholds>& mask);

    /**
     * @brief Read the process source raster and evaluate it
     */
    FinalGrid run(const std::string& process_source, const std::optional<MaskThresholds>& mask);

private:
    RasterEngine& engine_;
    Logger logger_;
};

} // namespace opendem
