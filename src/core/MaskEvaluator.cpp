/**
 * @file MaskEvaluator.cpp
 * @brief Implementation of the threshold mask
 */

#include "MaskEvaluator.hpp"

namespace opendem {

MaskEvaluator::MaskEvaluator(RasterEngine& engine)
    : engine_(engine), logger_("MaskEvaluator") {
}

ByteGrid MaskEvaluator::compute_mask(const RealGrid& data, const MaskThresholds& thresholds,
                                     double nodata) {
    Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> condition =
        Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>::Constant(
            data.rows(), data.cols(), true);

    if (thresholds.min) {
        condition = condition && (data >= *thresholds.min);
    }
    if (thresholds.max) {
        condition = condition && (data <= *thresholds.max);
    }

    // Nodata never counts as inside the mask
    condition = condition && (data != nodata);

    return condition.cast<std::uint8_t>();
}

FinalGrid MaskEvaluator::evaluate(const RealGrid& data, const std::optional<MaskThresholds>& mask) {
    FinalGrid result;

    if (mask && !mask->empty()) {
        result.binary = true;
        result.mask = compute_mask(data, *mask);
        result.nodata = MASK_NODATA;
        result.pixel_type = PixelType::BYTE;
    } else {
        result.binary = false;
        result.values = data;
        result.nodata = PROCESS_NODATA;
        result.pixel_type = PixelType::FLOAT32;
    }

    return result;
}

FinalGrid MaskEvaluator::run(const std::string& process_source,
                             const std::optional<MaskThresholds>& mask) {
    RasterInfo info = engine_.describe(process_source);
    RealGrid data = engine_.read_band(process_source, 1);

    if (mask && !mask->empty()) {
        logger_.info("Mask detected. Generating binary output (Thresholds: " + mask->describe() + ")");
    } else {
        logger_.info("No mask detected. Generating continuous float output.");
    }

    FinalGrid result = evaluate(data, mask);
    result.georef = info;

    if (result.binary) {
        logger_.detailed("Mask covers " + std::to_string(result.mask.cast<long>().sum()) +
                         " of " + std::to_string(result.mask.size()) + " pixels");
    }

    return result;
}

} // namespace opendem
