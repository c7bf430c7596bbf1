/**
 * @file opendem.cpp
 * @brief Out-of-line definitions for the shared types in opendem.hpp
 */

#include "opendem.hpp"
#include "version.h"
#include <sstream>

namespace opendem {

const char* version() {
    return OPENDEM_VERSION_STRING;
}

std::string MaskThresholds::describe() const {
    std::ostringstream oss;
    oss << "min=";
    if (min) oss << *min; else oss << "none";
    oss << ", max=";
    if (max) oss << *max; else oss << "none";
    return oss.str();
}

} // namespace opendem
