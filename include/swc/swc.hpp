/**
 * @file swc.hpp
 * @brief Main swc estimator class
 *
 * This is the primary interface of the soil water characteristic
 * library. It chains the pedotransfer functions and the Campbell
 * retention parameters:
 *
 *   texture → (θ33, θ1500) → ρB → θs → b → ψe → CampbellRetention
 *
 * and evaluates whole batches of independent samples in parallel.
 */

#pragma once

// Core includes
#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/texture.hpp"
#include "core/soil_properties.hpp"
#include "core/samples.hpp"
#include "core/config.hpp"

// Physics includes
#include "physics/pedotransfer.hpp"
#include "physics/water_retention.hpp"

// Atmosphere includes
#include "atmosphere/vapor_pressure.hpp"

namespace swc {

/**
 * @brief Soil water characteristic estimator
 *
 * Example usage:
 * @code
 * SWC estimator;
 * auto props = estimator.estimate(0.20, 0.40, 2.5);
 *
 * CampbellRetention curve(props);
 * Real psi = curve.water_potential(0.25);
 * Real theta = curve.water_content(-100.0);
 * @endcode
 *
 * All methods are const and hold no state besides the configuration,
 * so one estimator can be shared between threads.
 */
class SWC {
public:
    SWC() = default;
    explicit SWC(const Config& config);

    // ========================================================================
    // Factory Methods
    // ========================================================================

    /**
     * @brief Create estimator from configuration file
     */
    static SWC from_config(const std::string& config_file);

    /**
     * @brief Set configuration
     *
     * @throws std::invalid_argument if the configuration does not validate
     */
    void set_config(const Config& config);

    const Config& config() const { return config_; }

    // ========================================================================
    // Single Sample
    // ========================================================================

    /**
     * @brief Build the texture actually used for estimation
     *
     * Applies the configured organic matter source: a NaN organic matter
     * is replaced by the clay-based estimate unless the source is
     * Measured.
     *
     * @throws InvalidTextureError on invalid fractions or a missing
     *         organic matter that may not be estimated
     */
    TextureComposition resolve_texture(Real clay, Real sand, Real organic_matter) const;

    /**
     * @brief Field capacity and wilting point of a texture
     */
    MoisturePoints moisture_points(const TextureComposition& texture) const;

    /**
     * @brief Run the full estimator chain
     *
     * @throws DomainError, ArithmeticError when the texture lies so far
     *         outside the regression range that the chain breaks down
     */
    DerivedSoilProperties estimate(const TextureComposition& texture) const;

    /**
     * @brief Validate inputs and run the full estimator chain
     */
    DerivedSoilProperties estimate(Real clay, Real sand, Real organic_matter) const;

    /**
     * @brief Retention curve of a texture
     */
    CampbellRetention retention(const TextureComposition& texture) const;

    // ========================================================================
    // Batch
    // ========================================================================

    /**
     * @brief Estimate every sample of a batch
     *
     * Samples are independent and evaluated in parallel (OpenMP). A
     * failing sample is recorded in its slot and does not stop the batch.
     *
     * @throws std::invalid_argument if the input columns differ in length
     */
    BatchResult estimate_batch(const SoilSamples& samples) const;

private:
    Config config_;

    void log(const std::string& message) const;
    void check_calibration_range(const TextureComposition& texture, Real bulk_density) const;
};

} // namespace swc
