// =============================================================================
// FILE: psm/binding/c_api/core/dense.cpp
// BRIEF: PSI matrix view handles
// =============================================================================

#include "psm/binding/c_api/core/dense.h"
#include "psm/binding/c_api/core/internal.hpp"
#include "psm/core/type.hpp"

#include <memory>

using namespace psm;
using namespace psm::binding;

namespace {

// Shared body of the read-only property getters
template <typename Out, typename Getter>
psm_error_t query(psm_dense_t matrix, Out* out, Getter get) {
    PSM_C_API_CHECK_NULL(matrix, "Matrix is null");
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    *out = static_cast<Out>(get(matrix->view));
    PSM_C_API_RETURN_OK;
}

} // namespace

extern "C" {

PSM_EXPORT psm_error_t psm_dense_wrap(
    psm_dense_t* out,
    const psm_index_t rows,
    const psm_index_t cols,
    const psm_real_t* data,
    const psm_index_t stride) {

    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    PSM_C_API_CHECK_NULL(data, "PSI data pointer is null");
    PSM_C_API_CHECK(rows > 0, PSM_ERROR_INVALID_ARGUMENT, "PSI matrix needs at least one sample");
    PSM_C_API_CHECK(cols > 0, PSM_ERROR_INVALID_ARGUMENT, "PSI matrix needs at least one event");
    PSM_C_API_CHECK(stride >= cols, PSM_ERROR_INVALID_ARGUMENT, "Row stride must be >= cols");

    PSM_C_API_TRY
        auto handle = std::make_unique<psm_dense_matrix>(
            reinterpret_cast<const Real*>(data),
            static_cast<Index>(rows), static_cast<Index>(cols), static_cast<Index>(stride));
        *out = handle.release();
        PSM_C_API_RETURN_OK;
    PSM_C_API_CATCH
}

PSM_EXPORT psm_error_t psm_dense_destroy(psm_dense_t* matrix) {
    if (matrix != nullptr) {
        // The PSI buffer stays with the caller
        delete *matrix;
        *matrix = nullptr;
    }
    PSM_C_API_RETURN_OK;
}

PSM_EXPORT psm_error_t psm_dense_rows(psm_dense_t matrix, psm_index_t* out) {
    return query(matrix, out, [](const auto& v) { return v.rows; });
}

PSM_EXPORT psm_error_t psm_dense_cols(psm_dense_t matrix, psm_index_t* out) {
    return query(matrix, out, [](const auto& v) { return v.cols; });
}

PSM_EXPORT psm_error_t psm_dense_stride(psm_dense_t matrix, psm_index_t* out) {
    return query(matrix, out, [](const auto& v) { return v.stride; });
}

PSM_EXPORT psm_error_t psm_dense_size(psm_dense_t matrix, psm_size_t* out) {
    return query(matrix, out, [](const auto& v) { return v.size(); });
}

PSM_EXPORT psm_error_t psm_dense_is_contiguous(psm_dense_t matrix, psm_bool_t* out) {
    return query(matrix, out, [](const auto& v) { return v.is_contiguous() ? PSM_TRUE : PSM_FALSE; });
}

PSM_EXPORT psm_error_t psm_dense_get(
    psm_dense_t matrix,
    const psm_index_t row,
    const psm_index_t col,
    psm_real_t* out) {

    PSM_C_API_CHECK_NULL(matrix, "Matrix is null");
    PSM_C_API_CHECK_NULL(out, "Output pointer is null");
    const auto& v = matrix->view;
    PSM_C_API_CHECK(row >= 0 && row < v.rows, PSM_ERROR_INDEX_OUT_OF_BOUNDS, "Sample index out of bounds");
    PSM_C_API_CHECK(col >= 0 && col < v.cols, PSM_ERROR_INDEX_OUT_OF_BOUNDS, "Event index out of bounds");

    *out = static_cast<psm_real_t>(v.ptr[row * v.stride + col]);
    PSM_C_API_RETURN_OK;
}

} // extern "C"
