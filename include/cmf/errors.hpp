#pragma once

/// @file include/cmf/errors.hpp
/// @brief Exception taxonomy for input validation in the CMF library.
///
/// Only `ManifoldEngine::analyze`, the engine constructor, and timescale
/// parsing throw. Numeric primitives and the interpreter are `noexcept`;
/// zero-variance input is absorbed by epsilon-guarded denominators and is
/// never reported as an error.

#include <stdexcept>
#include <string>

namespace cmf {

/// Base class of every error raised by the library.
class ManifoldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The series is shorter than the operation requires.
class InsufficientDataError : public ManifoldError {
public:
    using ManifoldError::ManifoldError;
};

/// A configuration value (timescale tag, sensitivity, window) is unsupported.
class InvalidConfigurationError : public ManifoldError {
public:
    using ManifoldError::ManifoldError;
};

/// Parallel arrays disagree in length, or contain non-finite / negative
/// volume / decreasing timestamp samples.
class InvalidInputError : public ManifoldError {
public:
    using ManifoldError::ManifoldError;
};

} // namespace cmf
