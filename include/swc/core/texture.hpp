/**
 * @file texture.hpp
 * @brief Soil texture input and its validation
 *
 * A TextureComposition is the only entry point into the estimator
 * chain. It can only be built through create(), which rejects
 * out-of-range fractions, so every downstream function may assume a
 * physically valid texture.
 */

#pragma once

#include "types.hpp"

namespace swc {

/**
 * @brief Check texture inputs
 *
 * @param clay Clay fraction [0-1]
 * @param sand Sand fraction [0-1]
 * @param organic_matter Organic matter [%]
 *
 * @throws InvalidTextureError if a fraction is outside [0,1],
 *         clay + sand > 1, organic matter is negative or any input
 *         is not finite
 */
void validate_texture(Real clay, Real sand, Real organic_matter);

/**
 * @brief Validated, immutable soil texture
 */
class TextureComposition {
public:
    /**
     * @brief Validate and build a texture
     *
     * @throws InvalidTextureError (see validate_texture)
     */
    static TextureComposition create(Real clay, Real sand, Real organic_matter);

    Real clay() const { return clay_; }
    Real sand() const { return sand_; }
    Real organic_matter() const { return organic_matter_; }

    /// Silt fraction, the remainder of the mineral fractions
    Real silt() const { return 1.0 - clay_ - sand_; }

    /// Same mineral fractions with a different organic matter content
    TextureComposition with_organic_matter(Real organic_matter) const;

    bool operator==(const TextureComposition& other) const = default;

private:
    TextureComposition(Real clay, Real sand, Real organic_matter)
        : clay_(clay), sand_(sand), organic_matter_(organic_matter) {}

    Real clay_;
    Real sand_;
    Real organic_matter_;   ///< [%]
};

} // namespace swc
