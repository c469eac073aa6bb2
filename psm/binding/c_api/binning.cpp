// =============================================================================
// FILE: psm/binding/c_api/binning.cpp
// BRIEF: C API implementation for PSI binning
// =============================================================================

#include "psm/binding/c_api/binning.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/kernel/binning.hpp"
#include "psm/core/type.hpp"
#include "psm/core/error.hpp"

using namespace psm;
using namespace psm::binding;

namespace {

auto last_bin(psm_bool_t close_last_bin) -> kernel::binning::LastBin {
    return close_last_bin != PSM_FALSE ? kernel::binning::LastBin::Closed
                                       : kernel::binning::LastBin::LeftOpen;
}

} // anonymous namespace

extern "C" {

PSM_EXPORT psm_error_t psm_binning_validate_edges(
    const psm_real_t* edges,
    const psm_size_t n_edges) {

    PSM_C_API_CHECK_NULL(edges, "Edges array is null");

    PSM_C_API_TRY
        kernel::binning::validate_edges(
            Array<const Real>(reinterpret_cast<const Real*>(edges), n_edges));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_binning_bin_index(
    const psm_real_t value,
    const psm_real_t* edges,
    const psm_size_t n_edges,
    const psm_bool_t close_last_bin,
    psm_index_t* bin_out,
    psm_bool_t* defined) {

    PSM_C_API_CHECK_NULL(edges, "Edges array is null");
    PSM_C_API_CHECK_NULL(bin_out, "Output bin pointer is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined pointer is null");

    PSM_C_API_TRY
        Array<const Real> edge_arr(reinterpret_cast<const Real*>(edges), n_edges);
        kernel::binning::validate_edges(edge_arr);

        auto bin = kernel::binning::bin_index(static_cast<Real>(value), edge_arr,
                                                   last_bin(close_last_bin));
        *bin_out = bin ? static_cast<psm_index_t>(*bin) : psm_index_t(-1);
        *defined = bin ? PSM_TRUE : PSM_FALSE;
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_binning_binify(
    psm_dense_t psi,
    const psm_real_t* edges,
    const psm_size_t n_edges,
    const psm_bool_t close_last_bin,
    psm_real_t* fractions,
    uint8_t* defined,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(edges, "Edges array is null");
    PSM_C_API_CHECK_NULL(fractions, "Output fractions array is null");
    PSM_C_API_CHECK_NULL(defined, "Output defined array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        Array<const Real> edge_arr(reinterpret_cast<const Real*>(edges), n_edges);
        kernel::binning::validate_edges(edge_arr);

        DenseArray<Real> frac(reinterpret_cast<Real*>(fractions),
                              static_cast<Index>(n_edges - 1), psi->view.cols);
        kernel::binning::binify(psi->view, edge_arr, frac,
                                Array<Byte>(defined, n_events), last_bin(close_last_bin));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_binning_count_present(
    psm_dense_t psi,
    psm_index_t* counts,
    const psm_size_t n_events) {

    PSM_C_API_CHECK_NULL(psi, "PSI matrix is null");
    PSM_C_API_CHECK_NULL(counts, "Output counts array is null");
    PSM_C_API_CHECK(n_events == static_cast<psm_size_t>(psi->view.cols),
                   PSM_ERROR_DIMENSION_MISMATCH,
                   "n_events must equal the number of PSI columns");

    PSM_C_API_TRY
        kernel::binning::count_present(
            psi->view, Array<Index>(reinterpret_cast<Index*>(counts), n_events));
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

} // extern "C"
