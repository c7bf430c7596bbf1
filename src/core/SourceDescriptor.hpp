/**
 * @file SourceDescriptor.hpp
 * @brief GDAL WMS/TMS descriptor for the remote Terrarium tile pyramid
 */

#pragma once

#include "Logger.hpp"
#include <string>

namespace opendem {

/**
 * @brief Fixed global Web-Mercator tile pyramid parameters
 */
struct WebMercatorPyramid {
    static constexpr double EXTENT = 20037508.34;
    static constexpr int TILE_SIZE = 256;
    static constexpr int TILE_LEVEL = 15;
    static constexpr int BAND_COUNT = 3;
    static constexpr const char* PROJECTION = "EPSG:3857";
};

/**
 * @brief Writes the tiled source description consumed by the raster engine
 *
 * The artifact is regenerated on every run and overwritten in place; the
 * same source and cache directory always produce byte-identical content.
 */
class SourceDescriptorBuilder {
public:
    static constexpr const char* DESCRIPTOR_FILENAME = "source.vrt";

    SourceDescriptorBuilder();

    /**
     * @brief Write the descriptor under cache_dir
     * @param source Tile service URL template ({z}/{x}/{y} placeholders)
     * @param cache_dir Cache directory, also used for the tile cache
     * @return Path of the written descriptor
     * @throws ConfigurationError if source is empty
     */
    std::string build(const std::string& source, const std::string& cache_dir) const;

    /**
     * @brief Render the descriptor document without writing it
     * @param source Tile service URL template
     * @param absolute_cache_path Absolute path of the tile cache directory
     */
    static std::string render(const std::string& source, const std::string& absolute_cache_path);

private:
    Logger logger_;
};

} // namespace opendem
