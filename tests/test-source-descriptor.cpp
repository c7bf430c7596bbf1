#include <catch2/catch.hpp>

#include "common-cleanup.hpp"

#include "core/Errors.hpp"
#include "core/SourceDescriptor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace opendem;

namespace {

std::string read_file(std::string const &path)
{
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("descriptor document describes the Web Mercator tile pyramid",
          "[descriptor]")
{
    std::string const xml = SourceDescriptorBuilder::render(
        "https://tiles.example.org/{z}/{x}/{y}.png?a=1&b=2", "/tmp/cache");

    REQUIRE(xml.find("<Service name=\"TMS\">") != std::string::npos);
    REQUIRE(xml.find("<ServerUrl>https://tiles.example.org/{z}/{x}/{y}.png?a=1&amp;b=2</ServerUrl>") !=
            std::string::npos);
    REQUIRE(xml.find("<UpperLeftX>-20037508.34</UpperLeftX>") != std::string::npos);
    REQUIRE(xml.find("<UpperLeftY>20037508.34</UpperLeftY>") != std::string::npos);
    REQUIRE(xml.find("<LowerRightX>20037508.34</LowerRightX>") != std::string::npos);
    REQUIRE(xml.find("<LowerRightY>-20037508.34</LowerRightY>") != std::string::npos);
    REQUIRE(xml.find("<TileLevel>15</TileLevel>") != std::string::npos);
    REQUIRE(xml.find("<YOrigin>top</YOrigin>") != std::string::npos);
    REQUIRE(xml.find("<Projection>EPSG:3857</Projection>") != std::string::npos);
    REQUIRE(xml.find("<BlockSizeX>256</BlockSizeX>") != std::string::npos);
    REQUIRE(xml.find("<BandsCount>3</BandsCount>") != std::string::npos);
    REQUIRE(xml.find("<Cache><Path>/tmp/cache</Path></Cache>") != std::string::npos);
}

TEST_CASE("building twice yields a byte-identical descriptor", "[descriptor]")
{
    testing::cleanup::dir_t dir{"opendem-descriptor"};
    std::string const cache = dir.file("cache");

    SourceDescriptorBuilder builder;
    std::string const path = builder.build("https://a/{z}/{x}/{y}.png", cache);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(std::filesystem::path(path).filename() == "source.vrt");
    std::string const first = read_file(path);

    REQUIRE(builder.build("https://a/{z}/{x}/{y}.png", cache) == path);
    REQUIRE(read_file(path) == first);
}

TEST_CASE("building overwrites a descriptor for a different source",
          "[descriptor]")
{
    testing::cleanup::dir_t dir{"opendem-descriptor"};
    SourceDescriptorBuilder builder;

    std::string const path = builder.build("https://a/{z}/{x}/{y}.png", dir.path());
    builder.build("https://b/{z}/{x}/{y}.png", dir.path());

    std::string const content = read_file(path);
    REQUIRE(content.find("https://b/") != std::string::npos);
    REQUIRE(content.find("https://a/") == std::string::npos);
}

TEST_CASE("an empty source is a configuration error", "[descriptor]")
{
    testing::cleanup::dir_t dir{"opendem-descriptor"};
    SourceDescriptorBuilder builder;
    REQUIRE_THROWS_AS(builder.build("", dir.path()), ConfigurationError);
}
