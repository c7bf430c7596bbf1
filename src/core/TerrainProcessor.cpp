/**
 * @file TerrainProcessor.cpp
 * @brief Implementation of the terrain processing step
 */

#include "TerrainProcessor.hpp"
#include "RasterEngine.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace opendem {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

TerrainProcessor::TerrainProcessor(RasterEngine& engine, const std::string& cache_dir)
    : engine_(engine), cache_dir_(cache_dir), token_(nullptr), logger_("TerrainProcessor") {
}

const std::vector<std::string>& TerrainProcessor::supported_derivatives() {
    // color-relief needs a colour table and is not offered
    static const std::vector<std::string> names = {
        "hillshade", "slope", "aspect", "TRI", "TPI", "Roughness"
    };
    return names;
}

bool TerrainProcessor::is_supported(const std::string& derivative_name) {
    const std::string wanted = to_lower(derivative_name);
    const auto& names = supported_derivatives();
    return std::any_of(names.begin(), names.end(),
                       [&wanted](const std::string& name) { return to_lower(name) == wanted; });
}

void TerrainProcessor::check_supported(const std::string& derivative_name) {
    if (is_supported(derivative_name)) {
        return;
    }
    std::string supported;
    for (const auto& name : supported_derivatives()) {
        if (!supported.empty()) supported += ", ";
        supported += name;
    }
    throw ProcessingError("Unsupported terrain derivative '" + derivative_name +
                          "' (supported: " + supported + ")");
}

std::string TerrainProcessor::resolve_clipping_path(const std::string& clipping) {
    if (clipping.rfind("http", 0) == 0) {
        return "/vsicurl/" + clipping;
    }
    return clipping;
}

std::string TerrainProcessor::run(const std::string& elevation_path,
                                  const std::string& derivative_name,
                                  const std::optional<std::string>& clipping) {
    check_supported(derivative_name);

    logger_.info("Running terrain analysis: '" + derivative_name + "'...");

    const std::string derivative_path =
        (std::filesystem::path(cache_dir_) / DERIVATIVE_FILENAME).string();

    // Full rectangle first for edge accuracy
    try {
        engine_.terrain_derivative(derivative_path, elevation_path, derivative_name, token_);
    } catch (const RasterEngineError&) {
        if (token_) {
            token_->throw_if_cancelled("terrain derivative");
        }
        throw;
    }

    if (!clipping || clipping->empty()) {
        return derivative_path;
    }

    const std::string cutline = resolve_clipping_path(*clipping);
    logger_.info("Applying final cutline: " + cutline);

    const std::string clipped_path =
        (std::filesystem::path(cache_dir_) / CLIPPED_FILENAME).string();

    WarpRequest request;
    request.destination = clipped_path;
    request.source = derivative_path;
    request.cutline = cutline;
    request.crop_to_cutline = true;
    request.dst_nodata = PROCESS_NODATA;
    request.cancellation = token_;
    try {
        engine_.warp(request);
    } catch (const RasterEngineError&) {
        if (token_) {
            token_->throw_if_cancelled("cutline clip");
        }
        throw;
    }

    return clipped_path;
}

} // namespace opendem
