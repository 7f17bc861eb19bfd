/**
 * @file swc.cpp
 * @brief Implementation of the SWC estimator
 */

#include "swc/swc.hpp"
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace swc {

SWC::SWC(const Config& config) {
    set_config(config);
}

SWC SWC::from_config(const std::string& config_file) {
    return SWC(Config::from_file(config_file));
}

void SWC::set_config(const Config& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid swc configuration");
    }
    config_ = config;
}

void SWC::log(const std::string& message) const {
    if (!config_.output.verbose) return;
    #pragma omp critical(swc_log)
    {
        std::cerr << "swc: " << message << "\n";
    }
}

void SWC::check_calibration_range(const TextureComposition& texture,
                                  Real bulk_density) const {
    if (!config_.estimation.check_calibration_range) return;
    if (bulk_density > constants::BULK_DENSITY_MIN
        && bulk_density < constants::BULK_DENSITY_MAX) {
        return;
    }
    std::ostringstream msg;
    msg << "bulk density " << bulk_density << " Mg/m3 outside calibration range ("
        << constants::BULK_DENSITY_MIN << ", " << constants::BULK_DENSITY_MAX
        << ") for clay=" << texture.clay() << ", sand=" << texture.sand()
        << ", om=" << texture.organic_matter();
    log(msg.str());
}

// ============================================================================
// Single Sample
// ============================================================================

TextureComposition SWC::resolve_texture(Real clay, Real sand, Real organic_matter) const {
    switch (config_.estimation.organic_matter) {
        case OrganicMatterSource::Measured:
            return TextureComposition::create(clay, sand, organic_matter);
        case OrganicMatterSource::Estimated:
            return TextureComposition::create(
                clay, sand, pedotransfer::organic_matter_estimate(clay));
        case OrganicMatterSource::EstimatedIfMissing:
            if (std::isnan(organic_matter)) {
                return TextureComposition::create(
                    clay, sand, pedotransfer::organic_matter_estimate(clay));
            }
            return TextureComposition::create(clay, sand, organic_matter);
        default:
            throw std::runtime_error("Unknown organic matter source");
    }
}

MoisturePoints SWC::moisture_points(const TextureComposition& texture) const {
    return pedotransfer::moisture_points(texture);
}

DerivedSoilProperties SWC::estimate(const TextureComposition& texture) const {
    const TextureComposition tex =
        config_.estimation.organic_matter == OrganicMatterSource::Estimated
            ? texture.with_organic_matter(pedotransfer::organic_matter_estimate(texture.clay()))
            : texture;

    const MoisturePoints points = pedotransfer::moisture_points(tex);

    Real bulk_density = 0.0;
    Real theta_s = 0.0;
    switch (config_.estimation.saturation) {
        case SaturationMethod::BulkDensity:
            bulk_density = pedotransfer::bulk_density(tex);
            theta_s = saturated_water_content(bulk_density);
            break;
        case SaturationMethod::Regression:
            theta_s = pedotransfer::saturated_water_content(tex, points.water_content_33);
            if (!(theta_s > 0.0) || theta_s >= 1.0) {
                throw DomainError("Saturated water content must be in (0, 1), got "
                                  + std::to_string(theta_s));
            }
            bulk_density = (1.0 - theta_s) * constants::PARTICLE_DENSITY;
            break;
        default:
            throw std::runtime_error("Unknown saturation method");
    }
    check_calibration_range(tex, bulk_density);

    const Real b = b_value(points.water_content_33, points.water_content_1500);
    const Real psi_e = air_entry_potential(points.water_content_33, theta_s, b);

    return DerivedSoilProperties(points, bulk_density, theta_s, b, psi_e);
}

DerivedSoilProperties SWC::estimate(Real clay, Real sand, Real organic_matter) const {
    return estimate(resolve_texture(clay, sand, organic_matter));
}

CampbellRetention SWC::retention(const TextureComposition& texture) const {
    return CampbellRetention(estimate(texture));
}

// ============================================================================
// Batch
// ============================================================================

BatchResult SWC::estimate_batch(const SoilSamples& samples) const {
    samples.check_sizes();

    const Index n = samples.size();
    BatchResult result;
    result.resize(n);

#ifdef _OPENMP
    const int n_threads = config_.parallel.num_threads > 0
                        ? config_.parallel.num_threads
                        : omp_get_max_threads();
#endif

    #pragma omp parallel for schedule(static) num_threads(n_threads) \
        if(n >= config_.parallel.min_batch_size)
    for (Index i = 0; i < n; ++i) {
        try {
            result.set(i, estimate(samples.clay(i), samples.sand(i),
                                   samples.organic_matter(i)));
        } catch (const Error& e) {
            result.set_failure(i, e);
        }
    }

    if (config_.output.verbose) {
        std::ostringstream msg;
        msg << "batch of " << n << " samples, " << result.n_failed() << " failed";
        log(msg.str());
        for (Index i = 0; i < n; ++i) {
            const auto& s = result.samples[static_cast<Size>(i)];
            if (!s.success) {
                log("  sample " + std::to_string(i) + " [" + to_string(s.error)
                    + "]: " + s.message);
            }
        }
    }

    return result;
}

} // namespace swc
