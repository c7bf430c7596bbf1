/**
 * @file ElevationDecoder.cpp
 * @brief Implementation of Terrarium decoding
 */

#include "ElevationDecoder.hpp"
#include "RasterEngine.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace opendem {

ElevationDecoder::ElevationDecoder(RasterEngine& engine)
    : engine_(engine), logger_("ElevationDecoder") {
}

RealGrid ElevationDecoder::decode(const RealGrid& red, const RealGrid& green, const RealGrid& blue) {
    if (red.rows() != green.rows() || red.rows() != blue.rows() ||
        red.cols() != green.cols() || red.cols() != blue.cols()) {
        throw ProcessingError("RGB bands differ in size");
    }

    return (red * 256.0 + green + blue / 256.0) - 32768.0;
}

ElevationStats ElevationDecoder::summarize(const RealGrid& elevation) {
    ElevationStats stats;
    double min_value = std::numeric_limits<double>::infinity();
    double max_value = -std::numeric_limits<double>::infinity();

    for (Eigen::Index i = 0; i < elevation.size(); ++i) {
        double value = elevation.data()[i];
        if (std::isnan(value)) continue;
        min_value = std::min(min_value, value);
        max_value = std::max(max_value, value);
    }

    if (min_value <= max_value) {
        stats.min = min_value;
        stats.max = max_value;
    }
    return stats;
}

ElevationStats ElevationDecoder::run(const std::string& rgb_path, const std::string& elevation_path) {
    logger_.info("Decoding RGB bands into metric elevation data...");

    RasterInfo info = engine_.describe(rgb_path);
    if (info.band_count < 3) {
        throw ProcessingError("Acquired raster has " + std::to_string(info.band_count) +
                              " band(s), Terrarium decoding needs 3: " + rgb_path);
    }

    RealGrid red = engine_.read_band(rgb_path, 1);
    RealGrid green = engine_.read_band(rgb_path, 2);
    RealGrid blue = engine_.read_band(rgb_path, 3);

    RealGrid elevation = decode(red, green, blue);

    ElevationStats stats = summarize(elevation);
    char stats_msg[128];
    std::snprintf(stats_msg, sizeof(stats_msg), "Elevation stats: Min %.2fm, Max %.2fm",
                  stats.min, stats.max);
    logger_.info(stats_msg);

    engine_.write_raster(elevation_path, elevation, info, PixelType::FLOAT32, std::nullopt);
    logger_.detailed("Elevation raster written: " + elevation_path);

    return stats;
}

} // namespace opendem
