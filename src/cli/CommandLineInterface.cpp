/**
 * @file CommandLineInterface.cpp
 * @brief Command line parsing for opendem
 */

#include "CommandLineInterface.hpp"
#include <filesystem>
#include <iostream>

namespace opendem {

std::string CommandLineInterface::usage() {
    return "Usage: opendem <config.json>";
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << usage() << std::endl;
        exit_code_ = 1;
        return false;
    }

    // Anything after the configuration path is ignored
    const std::string first = argv[1];

    std::error_code ec;
    if (!std::filesystem::is_regular_file(first, ec)) {
        std::cerr << "Error: Config file not found at " << first << std::endl;
        exit_code_ = 1;
        return false;
    }

    config_path_ = first;
    exit_code_ = 0;
    return true;
}

} // namespace opendem
