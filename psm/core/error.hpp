#pragma once

#include "psm/core/macros.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

// =============================================================================
// FILE: psm/core/error.hpp
// BRIEF: Exception hierarchy for configuration and I/O failures
// =============================================================================
//
// Only misconfiguration and environment failures throw. An event without
// enough data is a normal outcome (undefined flag, NaN, Unassigned) and
// never reaches this header.
//
// Every exception carries the ErrorCode the C layer returns for it.
// =============================================================================

namespace psm {

// Values are part of the C ABI (PSM_ERROR_* in core.h)
enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,

    INVALID_ARGUMENT = 10,
    DIMENSION_MISMATCH = 11,
    INDEX_OUT_OF_BOUNDS = 14,

    TYPE_ERROR = 20,

    IO_ERROR = 30,
    FILE_NOT_FOUND = 31,

    FEATURE_UNAVAILABLE = 41,
};

class PSM_EXPORT Exception : public std::exception {
public:
    Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

private:
    ErrorCode code_;
    std::string msg_;
};

// -----------------------------------------------------------------------------
// Caller mistakes
// -----------------------------------------------------------------------------

// Bad bin edges, thresholds, bootstrap settings or cache capacity
class ValueError : public Exception {
public:
    explicit ValueError(std::string msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, std::move(msg)) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

// Output buffers or datasets whose shape disagrees with the PSI matrix
class DimensionError : public ValueError {
public:
    explicit DimensionError(std::string msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, std::move(msg)) {}
};

// -----------------------------------------------------------------------------
// Storage
// -----------------------------------------------------------------------------

// Dataset of the wrong element class (e.g. integer PSI)
class TypeError : public Exception {
public:
    explicit TypeError(std::string msg)
        : Exception(ErrorCode::TYPE_ERROR, std::move(msg)) {}
};

class IOError : public Exception {
public:
    explicit IOError(std::string msg)
        : Exception(ErrorCode::IO_ERROR, std::move(msg)) {}

protected:
    IOError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class FileNotFoundError : public IOError {
public:
    explicit FileNotFoundError(std::string msg)
        : IOError(ErrorCode::FILE_NOT_FOUND, std::move(msg)) {}
};

// Built without the library a call needs (HDF5)
class FeatureUnavailableError : public Exception {
public:
    explicit FeatureUnavailableError(std::string msg)
        : Exception(ErrorCode::FEATURE_UNAVAILABLE, std::move(msg)) {}
};

// -----------------------------------------------------------------------------
// Process
// -----------------------------------------------------------------------------

class OutOfMemoryError : public Exception {
public:
    explicit OutOfMemoryError(std::string msg)
        : Exception(ErrorCode::OUT_OF_MEMORY, std::move(msg)) {}
};

// Broken internal invariant, always a bug in psm
class InternalError : public Exception {
public:
    explicit InternalError(const std::string& msg)
        : Exception(ErrorCode::INTERNAL_ERROR, "psm internal error: " + msg) {}
};

// =============================================================================
// Check Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define PSM_DETAIL_THROW_IF_NOT(condition, Error, msg) \
    do { \
        if (PSM_UNLIKELY(!(condition))) { \
            throw Error(msg); \
        } \
    } while (0)

#define PSM_CHECK_ARG(condition, msg) \
    PSM_DETAIL_THROW_IF_NOT(condition, psm::ValueError, msg)

#define PSM_CHECK_DIM(condition, msg) \
    PSM_DETAIL_THROW_IF_NOT(condition, psm::DimensionError, msg)

// Active in release builds too
#define PSM_ASSERT(condition, msg) \
    PSM_DETAIL_THROW_IF_NOT(condition, psm::InternalError, \
        std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")")

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace psm
