/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface: one positional configuration path
 */

#pragma once

#include "opendem.hpp"
#include <string>

namespace opendem {

/**
 * @brief Parses the command line and locates the configuration file
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     *
     * The first argument is the configuration path, whatever it looks like;
     * later arguments are ignored. Messages for the user are written here.
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if the pipeline should run, false to exit with get_exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);

    const std::string& get_config_path() const { return config_path_; }

    int get_exit_code() const { return exit_code_; }

    static std::string usage();

private:
    std::string config_path_;
    int exit_code_ = 0;
};

} // namespace opendem
