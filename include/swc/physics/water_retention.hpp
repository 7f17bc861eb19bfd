/**
 * @file water_retention.hpp
 * @brief Campbell soil water retention curve and its parameters
 *
 * Implements the power-law retention model of Campbell (1985):
 *
 *   ψ(θ) = ψe (θs/θ)^b
 *   θ(ψ) = θs (ψ/ψe)^(-1/b)
 *
 * together with the functions that derive its three parameters:
 * - θs from bulk density
 * - b from the two moisture points (Saxton & Rawls 2006)
 * - ψe from field capacity, θs and b (Kemanian & Stöckle 2010)
 *
 * Potentials are matric potentials in J/kg (negative = suction),
 * water contents are volumetric [m³/m³].
 */

#pragma once

#include "../core/types.hpp"
#include "../core/soil_properties.hpp"

namespace swc {

/**
 * @brief Saturated water content from bulk density
 *
 * θs = 1 - ρB/ρs (Campbell 1985)
 *
 * @throws DomainError if bulk density is not in (0, 2.65)
 */
Real saturated_water_content(Real bulk_density);

/**
 * @brief Campbell b from the moisture points
 *
 * b = (ln 1500 - ln 33) / (ln θ33 - ln θ1500)
 *
 * @throws DomainError if a content is <= 0 or θ33 < θ1500
 * @throws ArithmeticError if θ33 == θ1500
 */
Real b_value(Real water_content_33, Real water_content_1500);

/**
 * @brief Air-entry (bubbling) potential [J/kg]
 *
 * ψe = -33 (θ33/θs)^b, strictly in (-33, 0)
 *
 * @throws DomainError if θs <= 0, θ33 <= 0, θ33 >= θs or the power
 *         underflows (b very large)
 */
Real air_entry_potential(Real field_capacity, Real saturated_water_content, Real b);

/**
 * @brief Campbell (1985) retention curve
 *
 * Holds (θs, ψe, b) and converts in both directions. The constructor
 * does not validate: a degenerate bundle is reported by the
 * conversion that would divide by it.
 */
class CampbellRetention {
public:
    CampbellRetention() = default;

    CampbellRetention(Real theta_s, Real psi_e, Real b)
        : theta_s_(theta_s), psi_e_(psi_e), b_(b) {}

    explicit CampbellRetention(const DerivedSoilProperties& props)
        : theta_s_(props.saturated_water_content()),
          psi_e_(props.air_entry_potential()),
          b_(props.campbell_b()) {}

    /**
     * @brief Water potential ψ(θ) [J/kg], Campbell (1985) Eq. 5.9
     *
     * @throws InvalidArgumentError if θs <= 0 or θ <= 0
     */
    Real water_potential(Real theta) const;

    /**
     * @brief Water content θ(ψ) [m³/m³]
     *
     * @throws DomainError if ψe == 0, b == 0, θs <= 0 or ψ/ψe <= 0
     */
    Real water_content(Real psi) const;

    /// Specific moisture capacity C(ψ) = dθ/dψ
    Real moisture_capacity(Real psi) const;

    Real content_to_potential(Real theta) const { return water_potential(theta); }
    Real potential_to_content(Real psi) const { return water_content(psi); }

    // Vectorized versions (all entries are checked before any is evaluated)
    Vector water_potential_vec(const Vector& theta) const;
    Vector water_content_vec(const Vector& psi) const;

    // Accessors
    Real theta_s() const { return theta_s_; }
    Real psi_e() const { return psi_e_; }
    Real b() const { return b_; }

private:
    Real theta_s_ = 0.4;   // Saturated water content
    Real psi_e_ = -1.0;    // Air-entry potential [J/kg]
    Real b_ = 5.0;         // Campbell exponent

    void check_content(Real theta) const;
    void check_parameters_for_content() const;
    void check_potential(Real psi) const;
};

// ============================================================================
// Free-function interface for scalar Campbell computations
// ============================================================================

namespace retention {

/// ψ(θ) for the given curve parameters
inline Real water_potential(Real theta_s, Real psi_e, Real b, Real theta) {
    return CampbellRetention(theta_s, psi_e, b).water_potential(theta);
}

/// θ(ψ) for the given curve parameters
inline Real water_content(Real theta_s, Real psi_e, Real b, Real psi) {
    return CampbellRetention(theta_s, psi_e, b).water_content(psi);
}

} // namespace retention

} // namespace swc
