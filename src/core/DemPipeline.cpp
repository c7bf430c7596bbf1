/**
 * @file DemPipeline.cpp
 * @brief Implementation of the stage orchestrator
 */

#include "DemPipeline.hpp"
#include "CancellationToken.hpp"
#include "ElevationDecoder.hpp"
#include "Errors.hpp"
#include "MaskEvaluator.hpp"
#include "RasterEngine.hpp"
#include "SourceDescriptor.hpp"
#include "TerrainProcessor.hpp"
#include "../export/OutputExporter.hpp"
#include <filesystem>

namespace opendem {

DemPipeline::DemPipeline(const PipelineConfig& config, RasterEngine& engine,
                         const FailureClassifier& classifier,
                         const CancellationToken* token)
    : config_(config), engine_(engine), classifier_(classifier), token_(token),
      logger_("Pipeline") {
    if (config_.mask && config_.mask->empty()) {
        logger_.warning("Mask defines neither min nor max; generating continuous output");
        config_.mask.reset();
    }
}

std::string DemPipeline::artifact_path(const std::string& filename) const {
    return (std::filesystem::path(config_.cache_dir) / filename).string();
}

void DemPipeline::check_cancelled(const std::string& stage) const {
    if (token_) {
        token_->throw_if_cancelled(stage);
    }
}

void DemPipeline::prepare_cache() {
    std::error_code ec;
    std::filesystem::create_directories(config_.cache_dir, ec);
    if (ec) {
        throw ResourceError("Cannot create cache directory " + config_.cache_dir + ": " + ec.message());
    }
    engine_.configure_cache(config_.cache_dir);
}

PipelineResult DemPipeline::run() {
    PipelineResult result;
    tracker_.clear();

    // Fail before any network traffic when the run cannot succeed
    TerrainProcessor::check_supported(config_.process);
    OutputExporter::check_compatible(config_);

    prepare_cache();

    check_cancelled("source_descriptor");
    tracker_.startStage("source_descriptor");
    SourceDescriptorBuilder builder;
    const std::string descriptor = builder.build(config_.source, config_.cache_dir);
    tracker_.trackArtifact(descriptor);
    tracker_.completeStage("source_descriptor");

    check_cancelled("acquisition");
    tracker_.startStage("acquisition");
    AcquisitionStep acquisition(engine_, classifier_, retry_policy_);
    if (token_) {
        acquisition.set_cancellation_token(token_);
    }
    if (sleeper_) {
        acquisition.set_sleeper(sleeper_);
    }
    const std::string rgb_path = artifact_path(RGB_FILENAME);
    acquisition.acquire(descriptor, config_, rgb_path);
    result.acquisition_attempts = acquisition.get_attempts_made();
    tracker_.trackArtifact(rgb_path);
    tracker_.completeStage("acquisition");

    check_cancelled("decode");
    tracker_.startStage("decode");
    ElevationDecoder decoder(engine_);
    const std::string elevation_path = artifact_path(ELEVATION_FILENAME);
    result.elevation = decoder.run(rgb_path, elevation_path);
    tracker_.trackArtifact(elevation_path);
    tracker_.completeStage("decode");

    check_cancelled("terrain");
    tracker_.startStage("terrain");
    TerrainProcessor terrain(engine_, config_.cache_dir);
    terrain.set_cancellation_token(token_);
    const std::string process_source = terrain.run(elevation_path, config_.process, config_.clipping);
    tracker_.trackArtifact(process_source);
    tracker_.completeStage("terrain");

    check_cancelled("mask");
    tracker_.startStage("mask");
    MaskEvaluator evaluator(engine_);
    FinalGrid grid = evaluator.run(process_source, config_.mask);
    result.binary_mask = grid.binary;
    tracker_.completeStage("mask");

    check_cancelled("export");
    tracker_.startStage("export");
    OutputExporter exporter(engine_);
    exporter.set_cancellation_token(token_);
    result.format = exporter.run(grid, config_.output);
    result.output_path = config_.output;
    tracker_.completeStage("export");

    result.stages = tracker_.getTimings();
    result.artifacts = tracker_.getArtifacts();

    logger_.info("Process complete: " + config_.output);
    logger_.detailed(tracker_.getTimingReport());

    return result;
}

} // namespace opendem
