/**
 * @file errors.cpp
 * @brief Error kind names
 */

#include "swc/core/errors.hpp"

namespace swc {

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidTexture: return "InvalidTexture";
        case ErrorKind::Domain: return "Domain";
        case ErrorKind::Arithmetic: return "Arithmetic";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

} // namespace swc
