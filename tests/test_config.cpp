#include <catch2/catch_test_macros.hpp>
#include "swc/swc.hpp"
#include <filesystem>
#include <sstream>

using namespace swc;

TEST_CASE("Default configuration", "[config]") {
    Config config;
    REQUIRE(config.estimation.organic_matter == OrganicMatterSource::EstimatedIfMissing);
    REQUIRE(config.estimation.saturation == SaturationMethod::BulkDensity);
    REQUIRE(config.estimation.check_calibration_range);
    REQUIRE(config.parallel.num_threads == 0);
    REQUIRE(config.parallel.min_batch_size == 64);
    REQUIRE_FALSE(config.output.verbose);
    REQUIRE(config.validate());
}

TEST_CASE("Parse configuration text", "[config]") {
    const std::string text =
        "# soil survey run\n"
        "estimation:\n"
        "  organic_matter: Measured   # lab values only\n"
        "  saturation: Regression\n"
        "  check_calibration_range: no\n"
        "\n"
        "parallel:\n"
        "  num_threads: 4\n"
        "  min_batch_size: 16\n"
        "output:\n"
        "  verbose: true\n";

    Config config = Config::from_string(text);
    REQUIRE(config.estimation.organic_matter == OrganicMatterSource::Measured);
    REQUIRE(config.estimation.saturation == SaturationMethod::Regression);
    REQUIRE_FALSE(config.estimation.check_calibration_range);
    REQUIRE(config.parallel.num_threads == 4);
    REQUIRE(config.parallel.min_batch_size == 16);
    REQUIRE(config.output.verbose);
}

TEST_CASE("Configuration round trip", "[config]") {
    Config config;
    config.estimation.organic_matter = OrganicMatterSource::Estimated;
    config.estimation.saturation = SaturationMethod::Regression;
    config.parallel.num_threads = 2;
    config.output.verbose = true;

    Config parsed = Config::from_string(config.to_string());
    REQUIRE(parsed.estimation.organic_matter == config.estimation.organic_matter);
    REQUIRE(parsed.estimation.saturation == config.estimation.saturation);
    REQUIRE(parsed.estimation.check_calibration_range == config.estimation.check_calibration_range);
    REQUIRE(parsed.parallel.num_threads == 2);
    REQUIRE(parsed.parallel.min_batch_size == config.parallel.min_batch_size);
    REQUIRE(parsed.output.verbose);

    SECTION("Through a file") {
        auto path = std::filesystem::temp_directory_path() / "swc_test_config.yaml";
        config.to_file(path);
        Config loaded = Config::from_file(path);
        REQUIRE(loaded.estimation.organic_matter == OrganicMatterSource::Estimated);
        REQUIRE(loaded.parallel.num_threads == 2);

        SWC estimator = SWC::from_config(path.string());
        REQUIRE(estimator.config().estimation.saturation == SaturationMethod::Regression);
        std::filesystem::remove(path);
    }
}

TEST_CASE("Unknown values are rejected", "[config]") {
    REQUIRE_THROWS_AS(Config::from_string("estimation:\n  saturation: Porosity\n"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Config::from_string("estimation:\n  organic_matter: Guess\n"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Config::from_string("output:\n  verbose: maybe\n"),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/swc.yaml"), std::runtime_error);
}

TEST_CASE("Boolean spellings", "[config]") {
    REQUIRE(config_io::bool_from_string("TRUE"));
    REQUIRE(config_io::bool_from_string("yes"));
    REQUIRE(config_io::bool_from_string("1"));
    REQUIRE_FALSE(config_io::bool_from_string("False"));
    REQUIRE_FALSE(config_io::bool_from_string("0"));
}

TEST_CASE("Configuration validation", "[config]") {
    Config config;
    config.parallel.num_threads = -1;
    REQUIRE_FALSE(config.validate());

    config.parallel.num_threads = 1;
    config.parallel.min_batch_size = 0;
    REQUIRE_FALSE(config.validate());

    SWC estimator;
    REQUIRE_THROWS_AS(estimator.set_config(config), std::invalid_argument);
}

TEST_CASE("Configuration summary", "[config]") {
    Config config;
    std::ostringstream os;
    config.print_summary(os);
    REQUIRE(os.str().find("EstimatedIfMissing") != std::string::npos);
    REQUIRE(os.str().find("BulkDensity") != std::string::npos);
}
