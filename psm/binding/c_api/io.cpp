// =============================================================================
// FILE: psm/binding/c_api/io.cpp
// BRIEF: C API implementation for HDF5 PSI input/output
// =============================================================================

#include "psm/binding/c_api/io.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/core/type.hpp"
#include "psm/core/error.hpp"

#ifdef PSM_HAS_HDF5
#include "psm/io/psi_file.hpp"
#endif

#include <algorithm>
#include <string>

using namespace psm;
using namespace psm::binding;

#ifndef PSM_HAS_HDF5
namespace {

[[noreturn]] void hdf5_unavailable() {
    throw FeatureUnavailableError("psm was built without HDF5 support");
}

} // anonymous namespace
#endif

extern "C" {

PSM_EXPORT psm_error_t psm_io_psi_shape(
    const char* path,
    const char* dataset,
    psm_index_t* rows,
    psm_index_t* cols) {

    PSM_C_API_CHECK_NULL(path, "Path is null");
    PSM_C_API_CHECK_NULL(dataset, "Dataset name is null");
    PSM_C_API_CHECK_NULL(rows, "Output rows pointer is null");
    PSM_C_API_CHECK_NULL(cols, "Output cols pointer is null");

    PSM_C_API_TRY
#ifdef PSM_HAS_HDF5
        auto shape = io::psi_shape(path, dataset);
        *rows = static_cast<psm_index_t>(shape.rows);
        *cols = static_cast<psm_index_t>(shape.cols);
        PSM_C_API_RETURN_OK;
#else
        hdf5_unavailable();
#endif
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_io_read_psi(
    const char* path,
    const char* dataset,
    psm_real_t* out,
    const psm_size_t capacity) {

    PSM_C_API_CHECK_NULL(path, "Path is null");
    PSM_C_API_CHECK_NULL(dataset, "Dataset name is null");
    PSM_C_API_CHECK_NULL(out, "Output buffer is null");

    PSM_C_API_TRY
#ifdef PSM_HAS_HDF5
        auto psi = io::read_psi(path, dataset);
        PSM_CHECK_DIM(capacity >= psi.values.size(),
                      "Output buffer holds " + std::to_string(capacity) +
                      " values, dataset has " + std::to_string(psi.values.size()));
        std::copy(psi.values.begin(), psi.values.end(), out);
        PSM_C_API_RETURN_OK;
#else
        (void)capacity;
        hdf5_unavailable();
#endif
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_io_write_psi(
    const char* path,
    const char* dataset,
    psm_dense_t psi) {

    PSM_C_API_CHECK_NULL(path, "Path is null");
    PSM_C_API_CHECK_NULL(dataset, "Dataset name is null");
    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");

    PSM_C_API_TRY
#ifdef PSM_HAS_HDF5
        io::write_matrix(path, dataset, psi->view);
        PSM_C_API_RETURN_OK;
#else
        hdf5_unavailable();
#endif
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_io_write_assignments(
    const char* path,
    const char* dataset,
    const int8_t* codes,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(path, "Path is null");
    PSM_C_API_CHECK_NULL(dataset, "Dataset name is null");
    PSM_C_API_CHECK_NULL(codes, "Codes array is null");

    PSM_C_API_TRY
#ifdef PSM_HAS_HDF5
        io::write_assignments(path, dataset, Array<const std::int8_t>(codes, n_events));
        PSM_C_API_RETURN_OK;
#else
        (void)n_events;
        hdf5_unavailable();
#endif
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_io_read_assignments(
    const char* path,
    const char* dataset,
    int8_t* codes,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(path, "Path is null");
    PSM_C_API_CHECK_NULL(dataset, "Dataset name is null");
    PSM_C_API_CHECK_NULL(codes, "Output codes array is null");

    PSM_C_API_TRY
#ifdef PSM_HAS_HDF5
        auto stored = io::read_assignments(path, dataset);
        PSM_CHECK_DIM(stored.size() == n_events,
                      "Dataset has " + std::to_string(stored.size()) +
                      " assignments, expected " + std::to_string(n_events));
        std::copy(stored.begin(), stored.end(), codes);
        PSM_C_API_RETURN_OK;
#else
        (void)n_events;
        hdf5_unavailable();
#endif
    PSM_C_API_CATCH
}

} // extern "C"
