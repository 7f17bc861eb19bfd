/**
 * @file pedotransfer.hpp
 * @brief Pedotransfer functions: texture and organic matter to soil properties
 *
 * Implements the Saxton & Rawls (2006) regressions:
 * - θ1500 (wilting point), Eq. 1
 * - θ33 (field capacity), Eq. 2
 * - θS (saturation) and bulk density, Eq. 3, 5, 6
 *
 * and the Hassink & Whitmore (1997) organic matter estimate.
 *
 * Reference: Saxton, K.E., Rawls, W.J., 2006. Soil water characteristic
 * estimates by texture and organic matter for hydrologic solutions.
 * Soil Sci. Soc. Am. J. 70, 1569-1578.
 *
 * Units: clay and sand are fractions [0-1], organic matter is in
 * percent, water contents are volumetric [m³/m³].
 */

#pragma once

#include "../core/types.hpp"
#include "../core/texture.hpp"
#include "../core/soil_properties.hpp"

namespace swc {

namespace pedotransfer {

/**
 * @brief Volumetric water content at -33 J/kg (field capacity)
 *
 * θ33 = θ33t + (1.283 θ33t² - 0.374 θ33t - 0.015), R² = 0.63
 */
Real water_content_33(const TextureComposition& texture);

/**
 * @brief Volumetric water content at -1500 J/kg (wilting point)
 *
 * θ1500 = θ1500t + (0.14 θ1500t - 0.02), R² = 0.86
 */
Real water_content_1500(const TextureComposition& texture);

/// Both moisture points of a texture
MoisturePoints moisture_points(const TextureComposition& texture);

/**
 * @brief Saturated water content from the θ(S-33) regression
 *
 * θS = θ33 + θ(S-33) - 0.097 S + 0.043
 */
Real saturated_water_content(const TextureComposition& texture);

/// Same as above with θ33 already computed
Real saturated_water_content(const TextureComposition& texture, Real water_content_33);

/**
 * @brief Bulk density [Mg/m³]
 *
 * ρB = (1 - θS) ρs with ρs = 2.65 Mg/m³
 */
Real bulk_density(const TextureComposition& texture);

/**
 * @brief Organic matter estimate [%] from clay fraction
 *
 * Half of the carbon saturation of Hassink & Whitmore (1997), converted
 * to organic matter (C = 0.58 OM): OM = 1.81 + 3.2 clay.
 *
 * @throws InvalidTextureError if clay is outside [0,1]
 */
Real organic_matter_estimate(Real clay);

// Unvalidated-input overloads: build a TextureComposition first and
// throw InvalidTextureError on bad input.
Real water_content_33(Real clay, Real sand, Real organic_matter);
Real water_content_1500(Real clay, Real sand, Real organic_matter);
Real bulk_density(Real clay, Real sand, Real organic_matter);

} // namespace pedotransfer

} // namespace swc
