/**
 * @file main.cpp
 * @brief Main entry point for opendem
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "opendem.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/CancellationToken.hpp"
#include "core/DemPipeline.hpp"
#include "core/Errors.hpp"
#include "core/FailureClassifier.hpp"
#include "core/GdalRasterEngine.hpp"
#include "core/Logger.hpp"
#include <cstdio>
#include <iostream>

using namespace opendem;

namespace {

constexpr int EXIT_INTERRUPTED = 130;

/**
 * @brief Print run summary at DETAILED level
 */
void print_run_summary(const Logger& logger, const PipelineResult& result) {
    if (!logger.shouldOutput(LogLevel::DETAILED)) {
        return;
    }

    logger.detailed("=== Run Summary ===");
    logger.detailed("Output: " + result.output_path + " (" +
                    (result.format == ExportFormat::VECTOR ? "vector" : "raster") + ", " +
                    (result.binary_mask ? "binary mask" : "continuous") + ")");
    logger.detailed("Acquisition attempts: " + std::to_string(result.acquisition_attempts));

    char stats[96];
    std::snprintf(stats, sizeof(stats), "Elevation range: %.2fm to %.2fm",
                  result.elevation.min, result.elevation.max);
    logger.detailed(stats);

    for (const auto& stage : result.stages) {
        logger.detailed("  " + stage.name + ": " + std::to_string(stage.duration.count()) + "ms");
    }
    for (const auto& artifact : result.artifacts) {
        logger.detailed("  artifact: " + artifact);
    }
}

} // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.get_exit_code();
    }

    Logger logger("Main");

    try {
        ConfigurationManager manager;
        PipelineConfig config = manager.load_from_file(cli.get_config_path());

        if (!Logger::parseLogConfig(config.log_level)) {
            logger.warning("Ignoring invalid log_level entries in '" + config.log_level + "'");
        }
        Logger::setSharedLogFile(config.log_file);

        logger.info("Initialized opendem v" + std::string(version()) + " with config: " + cli.get_config_path());

        CancellationToken token;
        InterruptHandler interrupt_handler(token);
        interrupt_handler.install_handlers();

        GdalRasterEngine engine;
        RuleBasedFailureClassifier classifier;
        DemPipeline pipeline(config, engine, classifier, &token);

        PipelineResult result = pipeline.run();
        print_run_summary(logger, result);

    } catch (const OperationCancelled& e) {
        logger.error("Intercepted interrupt: " + std::string(e.what()));
        logger.flush();
        return EXIT_INTERRUPTED;
    } catch (const std::exception& e) {
        logger.error(e.what());
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
