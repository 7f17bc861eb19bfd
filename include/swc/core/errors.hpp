/**
 * @file errors.hpp
 * @brief Error taxonomy for swc
 *
 * Every estimator checks its preconditions before the arithmetic runs
 * and throws one of the types below. Batch callers catch swc::Error and
 * record the kind per sample instead of aborting the batch.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace swc {

/**
 * @brief Category of a failed computation
 */
enum class ErrorKind {
    None,               ///< No error (successful sample)
    InvalidTexture,     ///< Texture fractions or organic matter out of range
    Domain,             ///< log/pow of a value outside its domain
    Arithmetic,         ///< Division by zero (coincident moisture points)
    InvalidArgument,    ///< Non-physical argument to the retention curve
};

/**
 * @brief Base class of all swc errors
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Clay/sand fraction outside [0,1], clay + sand > 1 or organic matter < 0
class InvalidTextureError : public Error {
public:
    explicit InvalidTextureError(const std::string& what)
        : Error(ErrorKind::InvalidTexture, what) {}
};

/// A derived quantity would need a log of a non-positive number or a
/// negative base raised to a non-integer power
class DomainError : public Error {
public:
    explicit DomainError(const std::string& what)
        : Error(ErrorKind::Domain, what) {}

protected:
    DomainError(ErrorKind kind, const std::string& what)
        : Error(kind, what) {}
};

/// Division by zero, raised when the two moisture points coincide
class ArithmeticError : public Error {
public:
    explicit ArithmeticError(const std::string& what)
        : Error(ErrorKind::Arithmetic, what) {}
};

/// Zero or negative water content handed to the retention curve
class InvalidArgumentError : public DomainError {
public:
    explicit InvalidArgumentError(const std::string& what)
        : DomainError(ErrorKind::InvalidArgument, what) {}
};

/// Convert error kind to string
std::string to_string(ErrorKind kind);

} // namespace swc
