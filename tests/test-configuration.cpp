#include <catch2/catch.hpp>

#include "common-cleanup.hpp"

#include "cli/CommandLineInterface.hpp"
#include "cli/ConfigurationManager.hpp"
#include "core/Errors.hpp"
#include "core/InputValidator.hpp"

#include <fstream>

using namespace opendem;

namespace {

char const *const valid_config = R"({
    "source": "https://tiles.example.org/terrarium/{z}/{x}/{y}.png",
    "bounds": [7.0, 46.0, 7.1, 46.1],
    "resolution": 30,
    "process": "slope",
    "output": "out/steep.gpkg",
    "clipping": "aoi.geojson",
    "mask": {"min": 30},
    "log_level": "3,Acquisition=5"
})";

} // namespace

TEST_CASE("a complete configuration loads", "[config]")
{
    ConfigurationManager manager;
    PipelineConfig config = manager.load_from_string(valid_config);

    REQUIRE(config.source == "https://tiles.example.org/terrarium/{z}/{x}/{y}.png");
    REQUIRE(config.bounds.min_x == 7.0);
    REQUIRE(config.bounds.min_y == 46.0);
    REQUIRE(config.bounds.max_x == 7.1);
    REQUIRE(config.bounds.max_y == 46.1);
    REQUIRE(config.resolution == 30.0);
    REQUIRE(config.process == "slope");
    REQUIRE(config.output == "out/steep.gpkg");
    REQUIRE(*config.clipping == "aoi.geojson");
    REQUIRE(*config.mask->min == 30.0);
    REQUIRE_FALSE(config.mask->max.has_value());
    REQUIRE(config.cache_dir == "./cache");
    REQUIRE(config.log_level == "3,Acquisition=5");
    REQUIRE_FALSE(config.log_file.has_value());
}

TEST_CASE("optional keys keep their defaults", "[config]")
{
    ConfigurationManager manager;
    PipelineConfig config = manager.load_from_string(R"({
        "source": "s/{z}/{x}/{y}", "bounds": [0, 0, 1, 1],
        "resolution": 10.5, "process": "hillshade", "output": "h.tif",
        "log_level": 5, "cache_dir": "/tmp/dem"
    })");

    REQUIRE_FALSE(config.clipping.has_value());
    REQUIRE_FALSE(config.mask.has_value());
    REQUIRE(config.log_level == "5");
    REQUIRE(config.cache_dir == "/tmp/dem");
}

TEST_CASE("missing required keys are reported together", "[config]")
{
    ConfigurationManager manager;
    REQUIRE_THROWS_WITH(manager.load_from_string(R"({"source": "x", "process": "slope"})"),
                        Catch::Contains("bounds") && Catch::Contains("resolution") &&
                            Catch::Contains("output"));
}

TEST_CASE("wrong types are configuration errors", "[config]")
{
    ConfigurationManager manager;

    REQUIRE_THROWS_AS(manager.load_from_string("not json"), ConfigurationError);
    REQUIRE_THROWS_AS(manager.load_from_string("[1, 2]"), ConfigurationError);
    REQUIRE_THROWS_AS(manager.load_from_string(R"({
        "source": "s", "bounds": "7,46,8,47", "resolution": 30,
        "process": "slope", "output": "o.tif"})"), ConfigurationError);
    REQUIRE_THROWS_AS(manager.load_from_string(R"({
        "source": "s", "bounds": [7, 46, 8], "resolution": 30,
        "process": "slope", "output": "o.tif"})"), ConfigurationError);
    REQUIRE_THROWS_AS(manager.load_from_string(R"({
        "source": "s", "bounds": [7, 46, 8, 47], "resolution": "30",
        "process": "slope", "output": "o.tif"})"), ConfigurationError);
    REQUIRE_THROWS_AS(manager.load_from_string(R"({
        "source": "s", "bounds": [7, 46, 8, 47], "resolution": 30,
        "process": "slope", "output": "o.tif", "mask": {"min": "steep"}})"),
                      ConfigurationError);
}

TEST_CASE("validator collects every conflict", "[config]")
{
    PipelineConfig config;
    config.source = "s";
    config.process = "slope";
    config.output = "o.tif";
    config.resolution = -5.0;
    config.bounds = BoundingBox(8.0, 95.0, 7.0, 46.0);

    InputValidator validator;
    ValidationResult result = validator.validate(config);

    REQUIRE(result.has_errors());
    REQUIRE(result.conflicts.size() == 3);
    REQUIRE(result.warnings.empty());

    std::string const message = result.format_error_message();
    REQUIRE(message.find("Conflict 1") != std::string::npos);
    REQUIRE(message.find("Conflict 3") != std::string::npos);
    REQUIRE(message.find("resolution") != std::string::npos);
    REQUIRE(message.find("min_lon < max_lon") != std::string::npos);

    REQUIRE_THROWS_AS(ConfigurationManager::validate(config), ConfigurationError);
}

TEST_CASE("bounds order follows the bounding box check", "[config]")
{
    PipelineConfig config;
    config.source = "s";
    config.process = "slope";
    config.output = "o.tif";
    config.resolution = 30.0;
    InputValidator validator;

    config.bounds = BoundingBox(7.0, 46.0, 7.0, 46.1);
    REQUIRE_FALSE(config.bounds.is_valid());
    REQUIRE(validator.validate(config).conflicts.size() == 1);

    config.bounds = BoundingBox(7.0, 46.1, 7.1, 46.0);
    REQUIRE_FALSE(config.bounds.is_valid());
    REQUIRE(validator.validate(config).conflicts.size() == 1);

    config.bounds = BoundingBox(7.0, 46.0, 7.1, 46.1);
    REQUIRE(config.bounds.is_valid());
    REQUIRE_FALSE(validator.validate(config).has_errors());
}

TEST_CASE("inverted mask thresholds only warn", "[config]")
{
    PipelineConfig config;
    config.source = "s";
    config.process = "slope";
    config.output = "o.tif";
    config.resolution = 30.0;
    config.bounds = BoundingBox(7.0, 46.0, 7.1, 46.1);
    config.mask = MaskThresholds{};
    config.mask->min = 40.0;
    config.mask->max = 10.0;

    InputValidator validator;
    ValidationResult result = validator.validate(config);

    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.conflicts.empty());
    REQUIRE(result.warnings.size() == 1);
    REQUIRE(result.warnings.front().description.find("all zero") != std::string::npos);

    REQUIRE_NOTHROW(ConfigurationManager::validate(config));

    ConfigurationManager manager;
    PipelineConfig loaded = manager.load_from_string(R"({
        "source": "s/{z}/{x}/{y}", "bounds": [7.0, 46.0, 7.1, 46.1],
        "resolution": 30, "process": "slope", "output": "o.tif",
        "mask": {"min": 40, "max": 10}
    })");
    REQUIRE(*loaded.mask->min == 40.0);
    REQUIRE(*loaded.mask->max == 10.0);
}

TEST_CASE("a valid configuration has no conflicts", "[config]")
{
    PipelineConfig config;
    config.source = "s";
    config.process = "slope";
    config.output = "o.gpkg";
    config.resolution = 30.0;
    config.bounds = BoundingBox(-180.0, -90.0, 180.0, 90.0);

    InputValidator validator;
    ValidationResult result = validator.validate(config);
    REQUIRE_FALSE(result.has_errors());
    REQUIRE(result.format_error_message().empty());
}

TEST_CASE("configuration round-trips through its document form", "[config]")
{
    ConfigurationManager manager;
    PipelineConfig config = manager.load_from_string(valid_config);
    PipelineConfig again = ConfigurationManager::from_json(ConfigurationManager::to_json(config));

    REQUIRE(again.source == config.source);
    REQUIRE(again.bounds.max_y == config.bounds.max_y);
    REQUIRE(*again.mask->min == 30.0);
    REQUIRE(*again.clipping == "aoi.geojson");
}

TEST_CASE("configuration file is read from disk", "[config]")
{
    testing::cleanup::dir_t dir{"opendem-config"};
    std::string const path = dir.file("config.json");
    {
        std::ofstream file(path);
        file << valid_config;
    }

    ConfigurationManager manager;
    REQUIRE(manager.load_from_file(path).process == "slope");
    REQUIRE_THROWS_AS(manager.load_from_file(dir.file("missing.json")), ConfigurationError);
}

TEST_CASE("command line takes one existing config path", "[cli]")
{
    testing::cleanup::dir_t dir{"opendem-cli"};
    std::string const path = dir.file("config.json");
    {
        std::ofstream file(path);
        file << valid_config;
    }

    std::string program = "opendem";
    std::string missing = dir.file("nope.json");

    SECTION("no argument") {
        char *argv[] = {&program[0]};
        CommandLineInterface cli;
        REQUIRE_FALSE(cli.parse_arguments(1, argv));
        REQUIRE(cli.get_exit_code() == 1);
    }

    SECTION("missing file") {
        char *argv[] = {&program[0], &missing[0]};
        CommandLineInterface cli;
        REQUIRE_FALSE(cli.parse_arguments(2, argv));
        REQUIRE(cli.get_exit_code() == 1);
    }

    SECTION("existing file") {
        std::string arg = path;
        char *argv[] = {&program[0], &arg[0]};
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(2, argv));
        REQUIRE(cli.get_config_path() == path);
        REQUIRE(cli.get_exit_code() == 0);
    }

    SECTION("arguments after the config path are ignored") {
        std::string arg = path;
        std::string extra = "--verbose";
        std::string another = missing;
        char *argv[] = {&program[0], &arg[0], &extra[0], &another[0]};
        CommandLineInterface cli;
        REQUIRE(cli.parse_arguments(4, argv));
        REQUIRE(cli.get_config_path() == path);
        REQUIRE(cli.get_exit_code() == 0);
    }

    SECTION("a path that looks like an option is still a path") {
        std::string arg = "--version";
        char *argv[] = {&program[0], &arg[0]};
        CommandLineInterface cli;
        REQUIRE_FALSE(cli.parse_arguments(2, argv));
        REQUIRE(cli.get_exit_code() == 1);
    }
}

TEST_CASE("a config file named like an option is run", "[cli]")
{
    testing::cleanup::dir_t dir{"opendem-cli"};
    {
        std::ofstream file(dir.file("--help"));
        file << valid_config;
    }
    testing::cleanup::cwd_t cwd{dir.path()};

    std::string program = "opendem";
    std::string arg = "--help";
    char *argv[] = {&program[0], &arg[0]};
    CommandLineInterface cli;
    REQUIRE(cli.parse_arguments(2, argv));
    REQUIRE(cli.get_config_path() == "--help");
    REQUIRE(cli.get_exit_code() == 0);
}
