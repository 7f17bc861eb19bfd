/**
 * @file config.hpp
 * @brief Configuration and decisions for swc
 *
 * Defines the runtime configuration including:
 * - Estimation choices (organic matter source, saturation formulation)
 * - Parallel batch evaluation
 * - Diagnostic output
 */

#pragma once

#include "types.hpp"
#include <string>
#include <filesystem>
#include <iosfwd>

namespace swc {

/**
 * @brief Estimation decisions
 */
struct EstimationDecisions {
    // Organic matter handling
    OrganicMatterSource organic_matter = OrganicMatterSource::EstimatedIfMissing;

    // Saturated water content formulation
    SaturationMethod saturation = SaturationMethod::BulkDensity;

    // Warn when bulk density leaves the Saxton & Rawls calibration range
    bool check_calibration_range = true;

    /// Print decisions to stream
    void print(std::ostream& os) const;
};

/**
 * @brief Parallel execution configuration
 */
struct ParallelConfig {
    int num_threads = 0;            ///< 0 = use all available
    Index min_batch_size = 64;      ///< Smaller batches run serially
};

/**
 * @brief Output configuration
 */
struct OutputConfig {
    bool verbose = false;           ///< Diagnostics to std::cerr
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from YAML-style file
    static Config from_file(const std::filesystem::path& filepath);

    // Parse YAML-style text
    static Config from_string(const std::string& text);

    // Save to YAML-style file
    void to_file(const std::filesystem::path& filepath) const;

    // Serialize to YAML-style text
    std::string to_string() const;

    // Validate configuration
    bool validate() const;

    // Sub-configurations
    EstimationDecisions estimation;
    ParallelConfig parallel;
    OutputConfig output;

    // Print summary
    void print_summary(std::ostream& os) const;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {

/// Parse configuration from a stream of "section:" / "  key: value" lines
Config parse(std::istream& is);

/// Convert enum to string
std::string to_string(OrganicMatterSource om);
std::string to_string(SaturationMethod sm);

/// Convert string to enum
OrganicMatterSource organic_matter_from_string(const std::string& s);
SaturationMethod saturation_from_string(const std::string& s);

/// Parse "true"/"false" (also "yes"/"no", "1"/"0")
bool bool_from_string(const std::string& s);

} // namespace config_io

} // namespace swc
