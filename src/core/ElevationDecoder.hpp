#pragma once

/**
 * @file ElevationDecoder.hpp
 * @brief Terrarium RGB to metric elevation decoding
 */

#include "opendem.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <string>

namespace opendem {

class RasterEngine;

/**
 * @brief Decodes Terrarium-encoded RGB rasters into elevation in metres
 *
 * elevation = (R * 256 + G + B / 256) - 32768
 *
 * No clamping or validation is applied; void tiles decode to whatever
 * sentinel the tile source encodes.
 */
class ElevationDecoder {
public:
    explicit ElevationDecoder(RasterEngine& engine);

    /**
     * @brief Decode a single pixel
     */
    static double decode(std::uint8_t r, std::uint8_t g, std::uint8_t b) {
        return (r * 256.0 + g + b / 256.0) - 32768.0;
    }

    /**
     * @brief Decode whole bands (values 0-255 stored as reals)
     */
    static RealGrid decode(const RealGrid& red, const RealGrid& green, const RealGrid& blue);

    /**
     * @brief Min and max of a grid, NaN values ignored
     */
    static ElevationStats summarize(const RealGrid& elevation);

    /**
     * @brief Read the acquired RGB raster, decode it and persist the result
     *
     * The elevation raster is written as Float32 without a nodata value and
     * keeps the source georeferencing.
     *
     * @param rgb_path 3-band byte raster from the acquisition step
     * @param elevation_path Destination of the decoded elevation raster
     * @throws ProcessingError if the input has fewer than 3 bands
     */
    ElevationStats run(const std::string& rgb_path, const std::string& elevation_path);

private:
    RasterEngine& engine_;
    Logger logger_;
};

} // namespace opendem
