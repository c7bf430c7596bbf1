/**
 * @file GdalRasterEngine.hpp
 * @brief RasterEngine backed by GDAL/OGR
 */

#pragma once

#include "RasterEngine.hpp"
#include "Logger.hpp"

namespace opendem {

/**
 * @brief Production raster engine using the GDAL utility library
 *
 * Warp, terrain derivatives and polygon extraction map to GDALWarp,
 * GDALDEMProcessing and GDALPolygonize. Every failure is raised as a
 * RasterEngineError carrying CPLGetLastErrorNo() and the last GDAL message.
 */
class GdalRasterEngine : public RasterEngine {
public:
    GdalRasterEngine();
    ~GdalRasterEngine() override = default;

    void configure_cache(const std::string& cache_dir) override;

    void warp(const WarpRequest& request) override;

    void terrain_derivative(const std::string& destination,
                            const std::string& source,
                            const std::string& derivative_name,
                            const CancellationToken* cancellation) override;

    RasterInfo describe(const std::string& path) override;

    RealGrid read_band(const std::string& path, int band) override;

    void write_raster(const std::string& path, const RealGrid& data,
                      const RasterInfo& georef, PixelType pixel_type,
                      std::optional<double> nodata) override;

    void remove_vector_dataset(const std::string& path,
                               const std::string& driver_name) override;

    void extract_polygons(const PolygonLayerSpec& spec, const ByteGrid& mask,
                          const RasterInfo& georef, ProgressRelay* progress,
                          const CancellationToken* cancellation) override;

private:
    Logger logger_;
};

} // namespace opendem
