/**
 * @file texture.cpp
 * @brief Texture validation
 */

#include "swc/core/texture.hpp"
#include "swc/core/errors.hpp"
#include <cmath>
#include <sstream>

namespace swc {

void validate_texture(Real clay, Real sand, Real organic_matter) {
    if (!std::isfinite(clay) || !std::isfinite(sand) || !std::isfinite(organic_matter)) {
        std::ostringstream msg;
        msg << "Texture inputs must be finite (clay=" << clay << ", sand=" << sand
            << ", organic_matter=" << organic_matter << ")";
        throw InvalidTextureError(msg.str());
    }
    if (clay < 0.0 || clay > 1.0) {
        throw InvalidTextureError("Clay fraction must be in [0, 1], got "
                                  + std::to_string(clay));
    }
    if (sand < 0.0 || sand > 1.0) {
        throw InvalidTextureError("Sand fraction must be in [0, 1], got "
                                  + std::to_string(sand));
    }
    if (clay + sand > 1.0 + constants::TEXTURE_SUM_TOLERANCE) {
        std::ostringstream msg;
        msg << "Clay + sand must not exceed 1 (clay=" << clay << ", sand=" << sand << ")";
        throw InvalidTextureError(msg.str());
    }
    if (organic_matter < 0.0) {
        throw InvalidTextureError("Organic matter must be >= 0 %, got "
                                  + std::to_string(organic_matter));
    }
}

TextureComposition TextureComposition::create(Real clay, Real sand, Real organic_matter) {
    validate_texture(clay, sand, organic_matter);
    return TextureComposition(clay, sand, organic_matter);
}

TextureComposition TextureComposition::with_organic_matter(Real organic_matter) const {
    return create(clay_, sand_, organic_matter);
}

} // namespace swc
