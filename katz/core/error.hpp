#pragma once

#include "katz/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: katz/core/error.hpp
// BRIEF: katz-core Exception System
// =============================================================================

namespace katz {

// =============================================================================
// Error Codes (C-ABI Compatible)
// =============================================================================

enum class ErrorCode : std::int32_t {
    OK = 0,

    // General errors
    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    // Argument errors
    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    INDEX_OUT_OF_BOUNDS = 14,
    MISSING_ENTRY = 15,

    // Feature errors
    UNSUPPORTED_GRAPH = 42,

    // Numerical errors
    NUMERICAL_ERROR = 50,
    CONVERGENCE_ERROR = 54,
    SINGULAR_MATRIX = 55,
};

// =============================================================================
// Base Exception Class
// =============================================================================

class KATZ_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

    [[nodiscard]] auto message() const noexcept -> const std::string& {
        return msg_;
    }

protected:
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    ErrorCode code_;
    // NOLINTNEXTLINE(*-non-private-member-variables-in-classes)
    std::string msg_;
};

// =============================================================================
// Specialized Exception Classes
// =============================================================================

class OutOfMemoryError : public Exception {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : Exception(ErrorCode::OUT_OF_MEMORY, msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class IndexOutOfBoundsError : public ValueError {
public:
    explicit IndexOutOfBoundsError(const std::string& msg)
        : ValueError(ErrorCode::INDEX_OUT_OF_BOUNDS, msg) {}
};

/// A per-node input (initial vector, bias) has no value for some node.
class MissingEntryError : public ValueError {
public:
    explicit MissingEntryError(const std::string& msg)
        : ValueError(ErrorCode::MISSING_ENTRY, msg) {}
};

class MissingBetaEntryError : public MissingEntryError {
public:
    explicit MissingBetaEntryError(const std::string& msg)
        : MissingEntryError(msg) {}
};

/// The graph kind is outside what an algorithm accepts (e.g. multigraphs).
class UnsupportedGraphError : public Exception {
public:
    explicit UnsupportedGraphError(const std::string& msg)
        : Exception(ErrorCode::UNSUPPORTED_GRAPH, msg) {}
};

// =============================================================================
// Numerical Errors
// =============================================================================

class NumericalError : public Exception {
public:
    explicit NumericalError(const std::string& msg)
        : Exception(ErrorCode::NUMERICAL_ERROR, msg) {}

protected:
    explicit NumericalError(ErrorCode code, const std::string& msg)
        : Exception(code, msg) {}
};

class ConvergenceError : public NumericalError {
public:
    explicit ConvergenceError(std::int64_t iterations)
        : NumericalError(ErrorCode::CONVERGENCE_ERROR,
                         "Power iteration failed to converge in " +
                         std::to_string(iterations) + " iterations"),
          iterations_(iterations) {}

    ConvergenceError(std::int64_t iterations, const std::string& msg)
        : NumericalError(ErrorCode::CONVERGENCE_ERROR, msg),
          iterations_(iterations) {}

    /// Number of iterations attempted before giving up.
    [[nodiscard]] auto iterations() const noexcept -> std::int64_t {
        return iterations_;
    }

private:
    std::int64_t iterations_;
};

class SingularMatrixError : public NumericalError {
public:
    explicit SingularMatrixError(const std::string& msg = "Matrix is singular")
        : NumericalError(ErrorCode::SINGULAR_MATRIX, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
// Validation for user inputs
#define KATZ_CHECK_ARG(condition, msg) \
    do { \
        if (KATZ_UNLIKELY(!(condition))) { \
            throw katz::ValueError(msg); \
        } \
    } while(0)

// Validation for dimension mismatches
#define KATZ_CHECK_DIM(condition, msg) \
    do { \
        if (KATZ_UNLIKELY(!(condition))) { \
            throw katz::DimensionError(msg); \
        } \
    } while(0)

// Validation for index bounds
#define KATZ_CHECK_BOUNDS(index, size, msg) \
    do { \
        if (KATZ_UNLIKELY((index) < 0 || static_cast<std::size_t>(index) >= (size))) { \
            throw katz::IndexOutOfBoundsError(msg); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace katz
