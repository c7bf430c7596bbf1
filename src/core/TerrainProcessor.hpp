/**
 * @file TerrainProcessor.hpp
 * @brief Terrain derivative computation with optional polygon clipping
 */

#pragma once

#include "opendem.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace opendem {

class RasterEngine;
class CancellationToken;

/**
 * @brief Runs the derivative over the full elevation raster, then clips
 *
 * The derivative is computed before clipping so pixels on the area of
 * interest boundary see their true neighbours instead of nodata padding.
 */
class TerrainProcessor {
public:
    static constexpr const char* DERIVATIVE_FILENAME = "temp_proc.tif";
    static constexpr const char* CLIPPED_FILENAME = "final_clipped.tif";

    TerrainProcessor(RasterEngine& engine, const std::string& cache_dir);

    /**
     * @brief Derivative names accepted by run() (compared case-insensitively)
     */
    static const std::vector<std::string>& supported_derivatives();

    static bool is_supported(const std::string& derivative_name);

    /**
     * @throws ProcessingError naming the supported derivatives
     */
    static void check_supported(const std::string& derivative_name);

    /**
     * @brief Map a clipping source to the path the engine should open
     *
     * http(s) URLs are streamed through /vsicurl/ instead of downloaded.
     */
    static std::string resolve_clipping_path(const std::string& clipping);

    /**
     * @brief Compute the derivative and optionally clip it
     * @param elevation_path Decoded elevation raster
     * @param derivative_name Derivative to compute (slope, hillshade, ...)
     * @param clipping Optional polygon boundary path or URL
     * @return Path of the process source raster
     * @throws ProcessingError for an unsupported derivative
     * @throws OperationCancelled when the token is set while the engine runs
     */
    std::string run(const std::string& elevation_path, const std::string& derivative_name,
                    const std::optional<std::string>& clipping);

    /**
     * @brief Abandon the derivative or clip warp once this token is set
     */
    void set_cancellation_token(const CancellationToken* token) { token_ = token; }

private:
    RasterEngine& engine_;
    std::string cache_dir_;
    const CancellationToken* token_;
    Logger logger_;
};

} // namespace opendem
