/**
 * @file samples.hpp
 * @brief Column storage for batches of soil samples
 *
 * Samples are stored as one Eigen vector per input or output field,
 * indexed by sample. Failed samples keep their slot: the output
 * columns hold NaN there and the per-sample record carries the error.
 */

#pragma once

#include "types.hpp"
#include "errors.hpp"
#include "soil_properties.hpp"
#include <optional>

namespace swc {

/**
 * @brief Texture inputs of a batch
 */
struct SoilSamples {
    Vector clay;                    ///< Clay fraction [0-1]
    Vector sand;                    ///< Sand fraction [0-1]
    Vector organic_matter;          ///< Organic matter [%], NaN if unmeasured

    Index size() const { return clay.size(); }

    /// Allocate n samples (organic matter initialized to NaN)
    void resize(Index n);

    /// Check that all columns have the same length
    void check_sizes() const;
};

/**
 * @brief Outcome of one sample
 */
struct SampleResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::optional<DerivedSoilProperties> properties;
};

/**
 * @brief Outcome of a batch
 */
struct BatchResult {
    std::vector<SampleResult> samples;

    // Output columns (NaN where the sample failed)
    Vector water_content_33;
    Vector water_content_1500;
    Vector bulk_density;
    Vector saturated_water_content;
    Vector campbell_b;
    Vector air_entry_potential;

    Index size() const { return static_cast<Index>(samples.size()); }
    Index n_failed() const;

    /// Allocate n samples with NaN outputs
    void resize(Index n);

    /// Store a successful sample in slot i
    void set(Index i, const DerivedSoilProperties& props);

    /// Store a failure in slot i
    void set_failure(Index i, const Error& err);
};

} // namespace swc
