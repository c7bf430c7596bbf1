/**
 * @file SourceDescriptor.cpp
 * @brief Implementation of the tiled source descriptor builder
 */

#include "SourceDescriptor.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace opendem {

namespace {

// XML-escape the few characters that can occur in URL templates and paths
std::string xml_escape(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

} // namespace

SourceDescriptorBuilder::SourceDescriptorBuilder() : logger_("SourceDescriptor") {
}

std::string SourceDescriptorBuilder::render(const std::string& source,
                                            const std::string& absolute_cache_path) {
    std::ostringstream extent_ss;
    extent_ss << std::fixed << std::setprecision(2) << WebMercatorPyramid::EXTENT;
    const std::string extent = extent_ss.str();

    std::ostringstream xml;
    xml << "<GDAL_WMS>\n"
        << "    <Service name=\"TMS\">\n"
        << "        <ServerUrl>" << xml_escape(source) << "</ServerUrl>\n"
        << "    </Service>\n"
        << "    <DataWindow>\n"
        << "        <UpperLeftX>-" << extent << "</UpperLeftX>\n"
        << "        <UpperLeftY>" << extent << "</UpperLeftY>\n"
        << "        <LowerRightX>" << extent << "</LowerRightX>\n"
        << "        <LowerRightY>-" << extent << "</LowerRightY>\n"
        << "        <TileLevel>" << WebMercatorPyramid::TILE_LEVEL << "</TileLevel>\n"
        << "        <YOrigin>top</YOrigin>\n"
        << "    </DataWindow>\n"
        << "    <Projection>" << WebMercatorPyramid::PROJECTION << "</Projection>\n"
        << "    <BlockSizeX>" << WebMercatorPyramid::TILE_SIZE << "</BlockSizeX>\n"
        << "    <BlockSizeY>" << WebMercatorPyramid::TILE_SIZE << "</BlockSizeY>\n"
        << "    <BandsCount>" << WebMercatorPyramid::BAND_COUNT << "</BandsCount>\n"
        << "    <Cache><Path>" << xml_escape(absolute_cache_path) << "</Path></Cache>\n"
        << "</GDAL_WMS>";
    return xml.str();
}

std::string SourceDescriptorBuilder::build(const std::string& source,
                                           const std::string& cache_dir) const {
    if (source.empty()) {
        throw ConfigurationError("'source' is required to describe the tile service");
    }

    std::error_code ec;
    std::filesystem::create_directories(cache_dir, ec);
    if (ec) {
        throw ResourceError("Cannot create cache directory " + cache_dir + ": " + ec.message());
    }

    const std::filesystem::path descriptor_path =
        std::filesystem::path(cache_dir) / DESCRIPTOR_FILENAME;
    const std::string absolute_cache = std::filesystem::absolute(cache_dir).lexically_normal().string();

    std::ofstream file(descriptor_path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw ResourceError("Could not write source descriptor: " + descriptor_path.string());
    }
    file << render(source, absolute_cache);
    file.close();
    if (file.fail()) {
        throw ResourceError("Failed writing source descriptor: " + descriptor_path.string());
    }

    logger_.detailed("Source descriptor written: " + descriptor_path.string());
    return descriptor_path.string();
}

} // namespace opendem
