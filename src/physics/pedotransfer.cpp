/**
 * @file pedotransfer.cpp
 * @brief Saxton & Rawls (2006) regressions
 */

#include "swc/physics/pedotransfer.hpp"
#include "swc/core/errors.hpp"
#include <cmath>

namespace swc {

namespace pedotransfer {

namespace {

/// First-order texture combination for θ1500 (Eq. 1)
Real theta_1500_t(Real S, Real C, Real OM) {
    return -0.024 * S + 0.487 * C + 0.006 * OM
         + 0.005 * S * OM - 0.013 * C * OM + 0.068 * S * C + 0.031;
}

/// First-order texture combination for θ33 (Eq. 2)
Real theta_33_t(Real S, Real C, Real OM) {
    return -0.251 * S + 0.195 * C + 0.011 * OM
         + 0.006 * S * OM - 0.027 * C * OM + 0.452 * S * C + 0.299;
}

/// First-order texture combination for θ(S-33) (Eq. 3)
Real theta_s33_t(Real S, Real C, Real OM) {
    return 0.278 * S + 0.034 * C + 0.022 * OM
         - 0.018 * S * OM - 0.027 * C * OM - 0.584 * S * C + 0.078;
}

} // namespace

Real water_content_33(const TextureComposition& texture) {
    Real x = theta_33_t(texture.sand(), texture.clay(), texture.organic_matter());
    // θ33t + (1.283 θ33t² - 0.374 θ33t - 0.015)
    return -0.015 + 0.636 * x + 1.283 * x * x;
}

Real water_content_1500(const TextureComposition& texture) {
    Real x = theta_1500_t(texture.sand(), texture.clay(), texture.organic_matter());
    // θ1500t + (0.14 θ1500t - 0.02)
    return -0.02 + 1.14 * x;
}

MoisturePoints moisture_points(const TextureComposition& texture) {
    MoisturePoints points;
    points.water_content_33 = water_content_33(texture);
    points.water_content_1500 = water_content_1500(texture);
    return points;
}

Real saturated_water_content(const TextureComposition& texture) {
    return saturated_water_content(texture, water_content_33(texture));
}

Real saturated_water_content(const TextureComposition& texture, Real water_content_33) {
    Real x = theta_s33_t(texture.sand(), texture.clay(), texture.organic_matter());
    // θ(S-33) = θ(S-33)t + (0.636 θ(S-33)t - 0.107)
    Real theta_s33 = -0.107 + 1.636 * x;
    return 0.043 + water_content_33 + theta_s33 - 0.097 * texture.sand();
}

Real bulk_density(const TextureComposition& texture) {
    Real theta_s = saturated_water_content(texture);
    return (1.0 - theta_s) * constants::PARTICLE_DENSITY;
}

Real organic_matter_estimate(Real clay) {
    if (!std::isfinite(clay) || clay < 0.0 || clay > 1.0) {
        throw InvalidTextureError("Clay fraction must be in [0, 1], got "
                                  + std::to_string(clay));
    }
    // 0.032 per % clay, clay given as a fraction
    return 1.81 + 0.032 * clay * 100.0;
}

Real water_content_33(Real clay, Real sand, Real organic_matter) {
    return water_content_33(TextureComposition::create(clay, sand, organic_matter));
}

Real water_content_1500(Real clay, Real sand, Real organic_matter) {
    return water_content_1500(TextureComposition::create(clay, sand, organic_matter));
}

Real bulk_density(Real clay, Real sand, Real organic_matter) {
    return bulk_density(TextureComposition::create(clay, sand, organic_matter));
}

} // namespace pedotransfer

} // namespace swc
