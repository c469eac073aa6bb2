#pragma once

#include "psm/core/type.hpp"
#include "psm/core/dense.hpp"
#include "psm/core/error.hpp"
#include "psm/core/log.hpp"
#include "psm/io/hdf5.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <string>
#include <vector>

// =============================================================================
// FILE: psm/io/psi_file.hpp
// BRIEF: PSI matrices and assignment codes stored as HDF5 datasets
// =============================================================================
//
// A PSI dataset is 2-D, samples x events, any floating-point type.
// Assignments are 1-D int8 modality codes.
// =============================================================================

namespace psm::io {

/// @brief Owning row-major samples x events matrix.
struct PsiMatrix {
    Index rows = 0;
    Index cols = 0;
    std::vector<Real> values;

    [[nodiscard]] auto view() const noexcept -> DenseArray<const Real> {
        return DenseArray<const Real>(values.data(), rows, cols);
    }
};

struct PsiShape {
    Index rows = 0;
    Index cols = 0;
};

#ifdef PSM_HAS_HDF5

namespace detail {

inline void require_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw FileNotFoundError("PSI file not found: " + path);
    }
}

inline auto open_psi_dataset(const h5::File& file, const std::string& path,
                             const std::string& dataset) -> h5::Dataset {
    if (!file.exists(dataset)) {
        throw IOError("Dataset '" + dataset + "' not found in " + path);
    }
    h5::Dataset dset = file.open_dataset(dataset);
    if (dset.type_class() != H5T_FLOAT) {
        throw TypeError("Dataset '" + dataset + "' is not floating-point");
    }
    return dset;
}

inline auto shape_of(const h5::Dataset& dset, const std::string& dataset) -> PsiShape {
    auto dims = dset.dims();
    PSM_CHECK_DIM(dims.size() == 2,
                  "Dataset '" + dataset + "' must be 2-D, got rank " +
                  std::to_string(dims.size()));
    return PsiShape{static_cast<Index>(dims[0]), static_cast<Index>(dims[1])};
}

} // namespace detail

inline auto psi_shape(const std::string& path, const std::string& dataset) -> PsiShape {
    detail::require_file(path);
    h5::File file(path);
    auto dset = detail::open_psi_dataset(file, path, dataset);
    return detail::shape_of(dset, dataset);
}

inline auto read_psi(const std::string& path, const std::string& dataset) -> PsiMatrix {
    detail::require_file(path);
    h5::File file(path);
    auto dset = detail::open_psi_dataset(file, path, dataset);
    auto shape = detail::shape_of(dset, dataset);

    PsiMatrix psi;
    psi.rows = shape.rows;
    psi.cols = shape.cols;
    psi.values.resize(static_cast<Size>(shape.rows) * static_cast<Size>(shape.cols));
    if (!psi.values.empty()) {
        dset.read(psi.values.data());
    }

    log::logger().info("read PSI '{}' from {} ({} x {})", dataset, path, psi.rows, psi.cols);
    return psi;
}

// Creates or truncates the file
inline void write_matrix(const std::string& path, const std::string& dataset,
                         const DenseArray<const Real>& psi) {
    // Pack strided views before handing them to HDF5
    std::vector<Real> packed(static_cast<Size>(psi.rows) * static_cast<Size>(psi.cols));
    for (Index r = 0; r < psi.rows; ++r) {
        auto row = psi.row(r);
        std::memcpy(packed.data() + static_cast<Size>(r) * row.len, row.ptr, row.len * sizeof(Real));
    }

    h5::File file = h5::File::create(path);
    auto dset = file.create_dataset<Real>(
        dataset, {static_cast<hsize_t>(psi.rows), static_cast<hsize_t>(psi.cols)});
    if (!packed.empty()) {
        dset.write(packed.data());
    }
    file.flush();

    log::logger().info("wrote PSI '{}' to {} ({} x {})", dataset, path, psi.rows, psi.cols);
}

// Adds to an existing file (replacing a dataset of the same name) or creates one
inline void write_assignments(const std::string& path, const std::string& dataset,
                              Array<const std::int8_t> codes) {
    std::error_code ec;
    h5::File file = std::filesystem::exists(path, ec)
        ? h5::File(path, H5F_ACC_RDWR)
        : h5::File::create(path);

    if (file.exists(dataset)) {
        file.unlink(dataset);
    }
    auto dset = file.create_dataset<std::int8_t>(dataset, {static_cast<hsize_t>(codes.len)});
    if (codes.len > 0) {
        dset.write(codes.ptr);
    }
    file.flush();

    log::logger().info("wrote {} assignments '{}' to {}", codes.len, dataset, path);
}

inline auto read_assignments(const std::string& path, const std::string& dataset)
    -> std::vector<std::int8_t> {
    detail::require_file(path);
    h5::File file(path);
    if (!file.exists(dataset)) {
        throw IOError("Dataset '" + dataset + "' not found in " + path);
    }
    auto dset = file.open_dataset(dataset);
    auto dims = dset.dims();
    PSM_CHECK_DIM(dims.size() == 1, "Dataset '" + dataset + "' must be 1-D");

    std::vector<std::int8_t> codes(static_cast<Size>(dims[0]));
    if (!codes.empty()) {
        dset.read(codes.data());
    }
    return codes;
}

#endif // PSM_HAS_HDF5

} // namespace psm::io
