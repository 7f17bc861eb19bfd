/**
 * @file water_retention.cpp
 * @brief Campbell retention curve implementations
 */

#include "swc/physics/water_retention.hpp"
#include "swc/core/errors.hpp"
#include <cmath>
#include <sstream>

namespace swc {

Real saturated_water_content(Real bulk_density) {
    if (!(bulk_density > 0.0) || bulk_density >= constants::PARTICLE_DENSITY) {
        std::ostringstream msg;
        msg << "Bulk density must be in (0, " << constants::PARTICLE_DENSITY
            << ") Mg/m3, got " << bulk_density;
        throw DomainError(msg.str());
    }
    return 1.0 - bulk_density / constants::PARTICLE_DENSITY;
}

Real b_value(Real water_content_33, Real water_content_1500) {
    if (!(water_content_33 > 0.0) || !(water_content_1500 > 0.0)
        || !std::isfinite(water_content_33) || !std::isfinite(water_content_1500)) {
        std::ostringstream msg;
        msg << "Moisture points must be positive (theta_33=" << water_content_33
            << ", theta_1500=" << water_content_1500 << ")";
        throw DomainError(msg.str());
    }

    Real denom = std::log(water_content_33) - std::log(water_content_1500);
    if (water_content_33 == water_content_1500 || denom == 0.0) {
        throw ArithmeticError("Moisture points coincide (theta_33 = theta_1500 = "
                              + std::to_string(water_content_33) + "), b is undefined");
    }
    if (denom < 0.0) {
        std::ostringstream msg;
        msg << "Field capacity below wilting point (theta_33=" << water_content_33
            << " < theta_1500=" << water_content_1500 << "), texture outside calibration range";
        throw DomainError(msg.str());
    }

    // ln(1500/33) over ln(θ33/θ1500)
    return (std::log(-constants::WILTING_POINT_POTENTIAL)
            - std::log(-constants::FIELD_CAPACITY_POTENTIAL)) / denom;
}

Real air_entry_potential(Real field_capacity, Real saturated_water_content, Real b) {
    if (!(saturated_water_content > 0.0)) {
        throw DomainError("Saturated water content must be positive, got "
                          + std::to_string(saturated_water_content));
    }
    if (!(field_capacity > 0.0)) {
        throw DomainError("Field capacity must be positive, got "
                          + std::to_string(field_capacity));
    }
    if (field_capacity >= saturated_water_content) {
        std::ostringstream msg;
        msg << "Field capacity " << field_capacity
            << " must be below saturated water content " << saturated_water_content;
        throw DomainError(msg.str());
    }
    if (!(b > 0.0) || !std::isfinite(b)) {
        throw DomainError("Campbell b must be positive and finite, got " + std::to_string(b));
    }
    Real psi_e = constants::FIELD_CAPACITY_POTENTIAL
               * std::pow(field_capacity / saturated_water_content, b);
    if (!(psi_e < 0.0)) {
        std::ostringstream msg;
        msg << "Air-entry potential underflows to zero (theta_33/theta_s="
            << field_capacity / saturated_water_content << ", b=" << b
            << "), moisture points nearly coincide";
        throw DomainError(msg.str());
    }
    return psi_e;
}

// ============================================================================
// CampbellRetention
// ============================================================================

void CampbellRetention::check_content(Real theta) const {
    if (!(theta_s_ > 0.0)) {
        throw InvalidArgumentError("Saturated water content must be positive, got "
                                   + std::to_string(theta_s_));
    }
    if (!(theta > 0.0)) {
        throw InvalidArgumentError("Water content must be positive, got "
                                   + std::to_string(theta));
    }
}

void CampbellRetention::check_parameters_for_content() const {
    if (psi_e_ == 0.0) {
        throw DomainError("Air-entry potential is zero");
    }
    if (b_ == 0.0) {
        throw DomainError("Campbell b is zero");
    }
    if (!(theta_s_ > 0.0)) {
        throw DomainError("Saturated water content must be positive, got "
                          + std::to_string(theta_s_));
    }
}

void CampbellRetention::check_potential(Real psi) const {
    // Negative base to a fractional power, or zero to a negative power
    if (!(psi / psi_e_ > 0.0)) {
        std::ostringstream msg;
        msg << "Water potential " << psi << " J/kg has no content on a curve with"
            << " air-entry potential " << psi_e_ << " J/kg";
        throw DomainError(msg.str());
    }
}

Real CampbellRetention::water_potential(Real theta) const {
    check_content(theta);
    return psi_e_ * std::pow(theta_s_ / theta, b_);
}

Real CampbellRetention::water_content(Real psi) const {
    check_parameters_for_content();
    check_potential(psi);
    return theta_s_ * std::pow(psi / psi_e_, -1.0 / b_);
}

Real CampbellRetention::moisture_capacity(Real psi) const {
    Real theta = water_content(psi);
    // dθ/dψ = -θ / (b ψ)
    return -theta / (b_ * psi);
}

Vector CampbellRetention::water_potential_vec(const Vector& theta) const {
    const Index n = theta.size();
    for (Index i = 0; i < n; ++i) {
        check_content(theta(i));
    }

    Vector psi(n);
    #pragma omp simd
    for (Index i = 0; i < n; ++i) {
        psi(i) = psi_e_ * std::pow(theta_s_ / theta(i), b_);
    }
    return psi;
}

Vector CampbellRetention::water_content_vec(const Vector& psi) const {
    check_parameters_for_content();
    const Index n = psi.size();
    for (Index i = 0; i < n; ++i) {
        check_potential(psi(i));
    }

    Vector theta(n);
    const Real exponent = -1.0 / b_;
    #pragma omp simd
    for (Index i = 0; i < n; ++i) {
        theta(i) = theta_s_ * std::pow(psi(i) / psi_e_, exponent);
    }
    return theta;
}

} // namespace swc
