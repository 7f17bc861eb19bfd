/**
 * @file types.hpp
 * @brief Core type definitions for swc
 *
 * This file defines the fundamental types used throughout swc,
 * including scalar types, array types, estimation enums and the
 * physical constants shared by the pedotransfer functions.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace swc {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

// Dense vectors (one entry per soil sample or per retention query)
using Vector = Eigen::VectorXd;
using VectorI = Eigen::VectorXi;
using VectorRef = Eigen::Ref<Vector>;
using VectorConstRef = Eigen::Ref<const Vector>;

// ============================================================================
// Estimation Decision Enums
// ============================================================================

/**
 * @brief Where the organic matter content of a sample comes from
 */
enum class OrganicMatterSource {
    Measured,           ///< Use the value supplied with the texture
    Estimated,          ///< Always replace with OM = 1.81 + 3.2·clay
    EstimatedIfMissing, ///< Estimate only when the supplied value is NaN
};

/**
 * @brief Saturated water content formulation
 */
enum class SaturationMethod {
    BulkDensity,        ///< θs = 1 - ρB/ρs (Campbell 1985)
    Regression,         ///< θs from the Saxton & Rawls θ(S-33) regression
};

// ============================================================================
// Forward Declarations
// ============================================================================

class TextureComposition;
struct MoisturePoints;
class DerivedSoilProperties;
class CampbellRetention;
class Config;
class SWC;

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template<typename T>
using Ptr = std::shared_ptr<T>;

template<typename T>
using UniquePtr = std::unique_ptr<T>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real PARTICLE_DENSITY = 2.65;         ///< Mineral particle density [Mg/m³]
    constexpr Real FIELD_CAPACITY_POTENTIAL = -33.0;    ///< [J/kg]
    constexpr Real WILTING_POINT_POTENTIAL = -1500.0;   ///< [J/kg]
    constexpr Real BULK_DENSITY_MIN = 0.9;          ///< Calibration range of Saxton & Rawls [Mg/m³]
    constexpr Real BULK_DENSITY_MAX = 1.8;
    constexpr Real TEXTURE_SUM_TOLERANCE = 1e-9;    ///< Slack on clay + sand <= 1
    constexpr Real EPSILON = 1e-15;                 ///< Numerical zero
    constexpr Real NaN = std::numeric_limits<Real>::quiet_NaN();
}

} // namespace swc
