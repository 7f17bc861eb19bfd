#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "swc/swc.hpp"
#include <cmath>
#include <random>

using namespace swc;
using Catch::Approx;

namespace {

/// Textures inside the Saxton & Rawls calibration range
std::vector<TextureComposition> calibration_textures() {
    std::vector<TextureComposition> out;
    for (double clay : {0.05, 0.1, 0.2, 0.3, 0.4, 0.5}) {
        for (double sand : {0.05, 0.2, 0.4, 0.6, 0.8}) {
            if (clay + sand > 1.0) continue;
            for (double om : {0.5, 1.0, 2.5, 4.0}) {
                out.push_back(TextureComposition::create(clay, sand, om));
            }
        }
    }
    return out;
}

} // namespace

TEST_CASE("Estimator chain for a loam", "[swc]") {
    SWC estimator;
    auto props = estimator.estimate(0.20, 0.40, 2.5);

    REQUIRE(props.field_capacity() == Approx(0.2825).margin(1e-3));
    REQUIRE(props.wilting_point() == Approx(0.1370).margin(1e-3));
    REQUIRE(props.bulk_density() == Approx(1.4246).margin(1e-3));
    REQUIRE(props.saturated_water_content() == Approx(0.4624).margin(1e-3));
    REQUIRE(props.campbell_b() == Approx(5.274).margin(1e-2));
    REQUIRE(props.air_entry_potential() == Approx(-2.456).margin(1e-2));
    REQUIRE(props.plant_available_water() == Approx(0.1455).margin(1e-3));
    REQUIRE(props.is_consistent());
}

TEST_CASE("Estimator matches the individual functions", "[swc]") {
    SWC estimator;
    auto tex = TextureComposition::create(0.03, 0.92, 1.906);
    auto props = estimator.estimate(tex);

    double fc = pedotransfer::water_content_33(tex);
    double wp = pedotransfer::water_content_1500(tex);
    double rho_b = pedotransfer::bulk_density(tex);
    double theta_s = saturated_water_content(rho_b);
    double b = b_value(fc, wp);

    REQUIRE(props.field_capacity() == fc);
    REQUIRE(props.wilting_point() == wp);
    REQUIRE(props.bulk_density() == rho_b);
    REQUIRE(props.saturated_water_content() == theta_s);
    REQUIRE(props.campbell_b() == b);
    REQUIRE(props.air_entry_potential() == air_entry_potential(fc, theta_s, b));
    REQUIRE(props.bulk_density() == Approx(1.43).margin(1e-2));

    auto points = estimator.moisture_points(tex);
    REQUIRE(points.water_content_33 == fc);
    REQUIRE(points.water_content_1500 == wp);
}

TEST_CASE("Invariants hold across the calibration range", "[swc]") {
    SWC estimator;

    for (const auto& tex : calibration_textures()) {
        auto props = estimator.estimate(tex);

        REQUIRE(props.wilting_point() > 0.0);
        REQUIRE(props.wilting_point() < props.field_capacity());
        REQUIRE(props.field_capacity() < props.saturated_water_content());
        REQUIRE(props.saturated_water_content() < 1.0);
        REQUIRE(props.campbell_b() > 0.0);
        REQUIRE(props.air_entry_potential() < 0.0);
        REQUIRE(props.air_entry_potential() > -33.0);
        REQUIRE(props.bulk_density() > 0.9);
        REQUIRE(props.bulk_density() < 1.8);
        REQUIRE(props.is_consistent());
    }
}

TEST_CASE("Retention curve passes through the moisture points", "[swc]") {
    SWC estimator;

    for (const auto& tex : calibration_textures()) {
        auto props = estimator.estimate(tex);
        auto curve = estimator.retention(tex);

        // ψe is fitted so that ψ(θ33) = -33 J/kg
        REQUIRE(curve.water_potential(props.field_capacity()) == Approx(-33.0).epsilon(1e-9));
        // b is fitted so that the curve also hits -1500 J/kg at θ1500
        REQUIRE(curve.water_potential(props.wilting_point()) == Approx(-1500.0).epsilon(1e-9));

        for (int k = 1; k <= 10; ++k) {
            double theta = props.saturated_water_content() * k / 10.0;
            REQUIRE(curve.water_content(curve.water_potential(theta))
                    == Approx(theta).margin(1e-2));
        }
    }
}

TEST_CASE("Regression saturation gives the same properties", "[swc]") {
    Config config;
    config.estimation.saturation = SaturationMethod::Regression;
    SWC regression(config);
    SWC canonical;

    for (const auto& tex : calibration_textures()) {
        auto a = canonical.estimate(tex);
        auto b = regression.estimate(tex);
        REQUIRE(b.saturated_water_content() == Approx(a.saturated_water_content()).margin(1e-12));
        REQUIRE(b.bulk_density() == Approx(a.bulk_density()).margin(1e-12));
        REQUIRE(b.air_entry_potential() == Approx(a.air_entry_potential()).margin(1e-9));
    }
}

TEST_CASE("Organic matter source", "[swc][organic_matter]") {
    const double nan = std::nan("");

    SECTION("Missing organic matter is estimated by default") {
        SWC estimator;
        auto tex = estimator.resolve_texture(0.2, 0.4, nan);
        REQUIRE(tex.organic_matter() == Approx(2.45));

        auto props = estimator.estimate(0.2, 0.4, nan);
        auto expected = estimator.estimate(0.2, 0.4, 2.45);
        REQUIRE(props.campbell_b() == Approx(expected.campbell_b()));

        // Measured values are kept
        REQUIRE(estimator.resolve_texture(0.2, 0.4, 1.0).organic_matter() == 1.0);
    }

    SECTION("Measured source requires a value") {
        Config config;
        config.estimation.organic_matter = OrganicMatterSource::Measured;
        SWC estimator(config);
        REQUIRE_THROWS_AS(estimator.estimate(0.2, 0.4, nan), InvalidTextureError);
    }

    SECTION("Estimated source overrides measured values") {
        Config config;
        config.estimation.organic_matter = OrganicMatterSource::Estimated;
        SWC estimator(config);

        auto tex = TextureComposition::create(0.5, 0.2, 0.1);
        auto props = estimator.estimate(tex);
        auto expected = SWC().estimate(0.5, 0.2, 3.41);
        REQUIRE(props.field_capacity() == Approx(expected.field_capacity()));
        REQUIRE(estimator.resolve_texture(0.5, 0.2, 0.1).organic_matter() == Approx(3.41));
    }
}

TEST_CASE("Textures outside the regression range fail", "[swc]") {
    SWC estimator;

    // Pure sand: the wilting point regression goes negative
    REQUIRE(pedotransfer::water_content_1500(0.0, 1.0, 0.0) < 0.0);
    REQUIRE_THROWS_AS(estimator.estimate(0.0, 1.0, 0.0), DomainError);

    REQUIRE_THROWS_AS(estimator.estimate(0.7, 0.5, 1.0), InvalidTextureError);
}

TEST_CASE("Nearly coincident moisture points fail instead of a zero air entry", "[swc]") {
    SWC estimator;

    // Pure clay: the two regressions cross near 1.91 % organic matter
    auto tex = TextureComposition::create(1.0, 0.0, 1.9113);
    auto points = estimator.moisture_points(tex);
    REQUIRE(points.water_content_33 > points.water_content_1500);
    REQUIRE(points.water_content_33 - points.water_content_1500 < 1e-5);

    REQUIRE_THROWS_AS(estimator.estimate(tex), DomainError);

    SoilSamples samples;
    samples.resize(2);
    samples.clay << 0.20, 1.0;
    samples.sand << 0.40, 0.0;
    samples.organic_matter << 2.5, 1.9113;

    BatchResult result = estimator.estimate_batch(samples);
    REQUIRE(result.n_failed() == 1);
    REQUIRE(result.samples[0].success);
    REQUIRE_FALSE(result.samples[1].success);
    REQUIRE(result.samples[1].error == ErrorKind::Domain);
    REQUIRE_FALSE(result.samples[1].properties.has_value());
    REQUIRE(std::isnan(result.air_entry_potential(1)));
}

TEST_CASE("Batch isolates failing samples", "[swc][batch]") {
    SoilSamples samples;
    samples.resize(4);
    samples.clay << 0.20, 0.70, 0.00, 0.33;
    samples.sand << 0.40, 0.50, 1.00, 0.09;
    samples.organic_matter << 2.5, 1.0, 0.0, 2.866;

    SWC estimator;
    BatchResult result = estimator.estimate_batch(samples);

    REQUIRE(result.size() == 4);
    REQUIRE(result.n_failed() == 2);

    REQUIRE(result.samples[0].success);
    REQUIRE(result.samples[0].properties.has_value());
    REQUIRE(result.campbell_b(0) == Approx(estimator.estimate(0.2, 0.4, 2.5).campbell_b()));

    REQUIRE_FALSE(result.samples[1].success);
    REQUIRE(result.samples[1].error == ErrorKind::InvalidTexture);
    REQUIRE_FALSE(result.samples[1].message.empty());
    REQUIRE(std::isnan(result.bulk_density(1)));

    REQUIRE_FALSE(result.samples[2].success);
    REQUIRE(result.samples[2].error == ErrorKind::Domain);
    REQUIRE(std::isnan(result.air_entry_potential(2)));

    REQUIRE(result.samples[3].success);
    REQUIRE(result.water_content_1500(3) == Approx(0.21).margin(1e-2));
    REQUIRE(result.water_content_33(3) == Approx(0.38).margin(1e-2));
}

TEST_CASE("Large batch matches single-sample estimates", "[swc][batch]") {
    const Index n = 1000;
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(0.0, 1.0);

    SoilSamples samples;
    samples.resize(n);
    for (Index i = 0; i < n; ++i) {
        samples.clay(i) = 0.05 + 0.45 * dist(rng);
        samples.sand(i) = 0.05 + (0.9 - samples.clay(i)) * dist(rng);
        samples.organic_matter(i) = (i % 10 == 0) ? std::nan("") : 0.5 + 3.5 * dist(rng);
    }

    Config config;
    config.parallel.min_batch_size = 1;
    SWC estimator(config);
    BatchResult result = estimator.estimate_batch(samples);

    REQUIRE(result.size() == n);
    for (Index i = 0; i < n; ++i) {
        auto props = estimator.estimate(samples.clay(i), samples.sand(i),
                                        samples.organic_matter(i));
        REQUIRE(result.samples[i].success);
        REQUIRE(result.campbell_b(i) == props.campbell_b());
        REQUIRE(result.saturated_water_content(i) == props.saturated_water_content());
    }
}

TEST_CASE("Batch columns must have equal length", "[swc][batch]") {
    SoilSamples samples;
    samples.resize(3);
    samples.sand.resize(2);

    SWC estimator;
    REQUIRE_THROWS_AS(estimator.estimate_batch(samples), std::invalid_argument);
}

TEST_CASE("Empty batch", "[swc][batch]") {
    SoilSamples samples;
    samples.resize(0);

    BatchResult result = SWC().estimate_batch(samples);
    REQUIRE(result.size() == 0);
    REQUIRE(result.n_failed() == 0);
}

TEST_CASE("Invalid configuration is refused", "[swc]") {
    Config config;
    config.parallel.num_threads = -2;
    REQUIRE_THROWS_AS(SWC(config), std::invalid_argument);
}
