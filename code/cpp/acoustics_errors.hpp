#pragma once
#include <stdexcept>
#include <string>

/**
 * @file acoustics_errors.hpp
 * @brief Exception types raised by the decay-analysis pipeline.
 *
 * Every error carries a prefixed message (e.g. "InsufficientWindowError: ...")
 * so that it stays readable once translated to a Python exception.
 */

// Common base for all numeric-pipeline failures
class AcousticsError : public std::runtime_error {
public:
    AcousticsError(const std::string& kind, const std::string& message)
        : std::runtime_error(kind + ": " + message) {}
};

// Empty, all-zero or otherwise maximum-less signal
class DegenerateInputError : public AcousticsError {
public:
    explicit DegenerateInputError(const std::string& message)
        : AcousticsError("DegenerateInputError", message) {}
};

// A dB window selected too few points (or too little range) for a fit
class InsufficientWindowError : public AcousticsError {
public:
    InsufficientWindowError(const std::string& window, const std::string& message)
        : AcousticsError("InsufficientWindowError", window + ": " + message), window_(window) {}

    const std::string& window() const { return window_; }

private:
    std::string window_;
};

// Least-squares design matrix is rank deficient
class SingularFitError : public AcousticsError {
public:
    explicit SingularFitError(const std::string& message)
        : AcousticsError("SingularFitError", message) {}
};

// Fitted slope does not describe a decay
class InvalidSlopeError : public AcousticsError {
public:
    InvalidSlopeError(const std::string& window, double slope)
        : AcousticsError("InvalidSlopeError",
                         window + ": non-negative slope " + std::to_string(slope) + " dB/s"),
          window_(window), slope_(slope) {}

    const std::string& window() const { return window_; }
    double slope() const { return slope_; }

private:
    std::string window_;
    double slope_;
};

// Logarithm of a negative energy value, or NaN in a level series
class NumericDomainError : public AcousticsError {
public:
    explicit NumericDomainError(const std::string& message)
        : AcousticsError("NumericDomainError", message) {}
};
