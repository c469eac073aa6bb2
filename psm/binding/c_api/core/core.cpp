// =============================================================================
// FILE: psm/binding/c_api/core/core.cpp
// BRIEF: Version, build configuration, error state and log level
// =============================================================================

#include "psm/binding/c_api/core/core.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/core/error.hpp"
#include "psm/core/log.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace psm::binding {

namespace {

constexpr std::size_t MAX_MESSAGE = 512;

// One slot per thread, so concurrent callers never see each other's errors
struct ErrorSlot {
    psm_error_t code = PSM_OK;
    std::array<char, MAX_MESSAGE> message{};
};

thread_local ErrorSlot t_error;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

} // namespace

void set_last_error(psm_error_t code, std::string_view message) noexcept {
    t_error.code = code;
    const auto n = std::min(message.size(), MAX_MESSAGE - 1);
    std::memcpy(t_error.message.data(), message.data(), n);
    t_error.message[n] = '\0';
}

void clear_last_error() noexcept {
    t_error.code = PSM_OK;
    t_error.message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    return t_error.message[0] != '\0' ? t_error.message.data() : "No error";
}

auto get_last_error_code() noexcept -> psm_error_t {
    return t_error.code;
}

// psm exceptions carry their C code. Standard exceptions only arrive from
// allocation or container misuse inside the kernels.
[[nodiscard]] auto handle_exception() noexcept -> psm_error_t {
    psm_error_t code = PSM_ERROR_UNKNOWN;
    try {
        throw;
    } catch (const Exception& e) {
        code = static_cast<psm_error_t>(e.code());
        set_last_error(code, e.what());
    } catch (const std::bad_alloc&) {
        code = PSM_ERROR_OUT_OF_MEMORY;
        set_last_error(code, "Memory allocation failed");
    } catch (const std::length_error& e) {
        code = PSM_ERROR_OUT_OF_MEMORY;
        set_last_error(code, e.what());
    } catch (const std::logic_error& e) {
        code = PSM_ERROR_INVALID_ARGUMENT;
        set_last_error(code, e.what());
    } catch (const std::exception& e) {
        set_last_error(code, e.what());
    } catch (...) {
        set_last_error(code, "Unknown exception");
    }

    if (code == PSM_ERROR_INTERNAL || code == PSM_ERROR_UNKNOWN) {
        log::logger().error("{}", get_last_error_message());
    } else {
        log::logger().debug("call failed ({}): {}", code, get_last_error_message());
    }
    return code;
}

} // namespace psm::binding

// =============================================================================
// C API Implementation (Stable ABI)
// =============================================================================

namespace {

constexpr const char* SIMD_TARGET =
#if defined(PSM_ONLY_SCALAR)
    "scalar";
#elif defined(__AVX512F__)
    "avx512";
#elif defined(__AVX2__)
    "avx2";
#elif defined(__SSE4_2__)
    "sse4";
#elif defined(__ARM_NEON)
    "neon";
#else
    "baseline";
#endif

constexpr const char* BACKEND =
#if defined(PSM_USE_OPENMP)
    "openmp";
#elif defined(PSM_USE_TBB)
    "tbb";
#else
    "serial";
#endif

} // namespace

extern "C" {

PSM_EXPORT const char* psm_get_version(void) {
    static const std::string version =
        std::to_string(PSM_C_API_VERSION_MAJOR) + "." +
        std::to_string(PSM_C_API_VERSION_MINOR) + "." +
        std::to_string(PSM_C_API_VERSION_PATCH);
    return version.c_str();
}

PSM_EXPORT const char* psm_get_build_config(void) {
    static const std::string config = [] {
        std::string s = std::string(PSM_REAL_TYPE_NAME) + "+" + PSM_INDEX_TYPE_NAME +
                        "+" + SIMD_TARGET + "+" + BACKEND;
#if defined(PSM_HAS_HDF5)
        s += "+hdf5";
#endif
        return s;
    }();
    return config.c_str();
}

PSM_EXPORT const char* psm_get_last_error(void) {
    return psm::binding::get_last_error_message();
}

PSM_EXPORT psm_error_t psm_get_last_error_code(void) {
    return psm::binding::get_last_error_code();
}

PSM_EXPORT void psm_clear_error(void) {
    psm::binding::clear_last_error();
}

PSM_EXPORT psm_bool_t psm_is_ok(psm_error_t code) {
    return code == PSM_OK ? PSM_TRUE : PSM_FALSE;
}

PSM_EXPORT psm_bool_t psm_is_error(psm_error_t code) {
    return code != PSM_OK ? PSM_TRUE : PSM_FALSE;
}

PSM_EXPORT psm_error_t psm_set_log_level(int32_t level) {
    PSM_C_API_CHECK(level >= PSM_LOG_TRACE && level <= PSM_LOG_OFF,
                    PSM_ERROR_INVALID_ARGUMENT, "Log level must be in [0, 6]");

    PSM_C_API_TRY
        psm::log::set_level(static_cast<spdlog::level::level_enum>(level));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

} // extern "C"
