#pragma once

#include "psm/core/type.hpp"
#include "psm/core/error.hpp"
#include "psm/core/macros.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#ifdef PSM_HAS_HDF5
#include <hdf5.h>

// =============================================================================
// FILE: psm/io/hdf5.hpp
// BRIEF: Minimal RAII layer over the HDF5 C API
// =============================================================================
//
// Covers what the PSI file layer needs: open or create a file, look up,
// create and unlink datasets, and move whole datasets in and out of
// contiguous buffers. Every failed HDF5 call becomes an IOError carrying
// the HDF5 error stack.
// =============================================================================

namespace psm::io::h5 {

namespace detail {

template <typename T>
inline hid_t memory_type() {
    if constexpr (std::is_same_v<T, float>)             return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)       return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, std::int8_t>)  return H5T_NATIVE_INT8;
    else if constexpr (std::is_same_v<T, std::int64_t>) return H5T_NATIVE_INT64;
    else static_assert(!sizeof(T), "no HDF5 memory type for T");
}

// Appends the HDF5 error stack to msg and clears it
inline std::string describe_failure(const std::string& what) {
    std::string msg = "HDF5: " + what;
    H5Ewalk2(H5E_DEFAULT, H5E_WALK_DOWNWARD,
        [](unsigned, const H5E_error2_t* err, void* data) -> herr_t {
            if (err->desc != nullptr && err->desc[0] != '\0') {
                *static_cast<std::string*>(data) += "; " + std::string(err->desc);
            }
            return 0;
        }, &msg);
    H5Eclear2(H5E_DEFAULT);
    return msg;
}

inline void check(herr_t status, const std::string& what) {
    if (status < 0) {
        throw IOError(describe_failure(what));
    }
}

inline hid_t check_id(hid_t id, const std::string& what) {
    if (id < 0) {
        throw IOError(describe_failure(what));
    }
    return id;
}

// The library prints every failure to stderr by default, psm reports
// through exceptions and the logger instead
inline void silence_auto_print() {
    static const bool done = [] {
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
        return true;
    }();
    (void)done;
}

} // namespace detail

// Owns one hid_t and closes it with Close
template <herr_t (*Close)(hid_t)>
class Handle {
public:
    Handle() noexcept = default;
    explicit Handle(hid_t id) noexcept : id_(id) {}

    ~Handle() { reset(); }

    Handle(Handle&& other) noexcept : id_(std::exchange(other.id_, H5I_INVALID_HID)) {}

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            id_ = std::exchange(other.id_, H5I_INVALID_HID);
        }
        return *this;
    }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    [[nodiscard]] hid_t id() const noexcept { return id_; }

    void reset() noexcept {
        if (id_ >= 0) {
            Close(id_);
            id_ = H5I_INVALID_HID;
        }
    }

private:
    hid_t id_ = H5I_INVALID_HID;
};

using SpaceHandle = Handle<H5Sclose>;
using TypeHandle = Handle<H5Tclose>;

// =============================================================================
// Dataset
// =============================================================================

class Dataset {
public:
    explicit Dataset(hid_t id) noexcept : handle_(id) {}

    [[nodiscard]] std::vector<hsize_t> dims() const {
        SpaceHandle space(detail::check_id(H5Dget_space(handle_.id()), "H5Dget_space"));
        const int rank = H5Sget_simple_extent_ndims(space.id());
        if (rank < 0) {
            throw IOError(detail::describe_failure("H5Sget_simple_extent_ndims"));
        }
        std::vector<hsize_t> out(static_cast<Size>(rank));
        detail::check(H5Sget_simple_extent_dims(space.id(), out.data(), nullptr),
                      "H5Sget_simple_extent_dims");
        return out;
    }

    // H5T_FLOAT, H5T_INTEGER, ...
    [[nodiscard]] H5T_class_t type_class() const {
        TypeHandle type(detail::check_id(H5Dget_type(handle_.id()), "H5Dget_type"));
        return H5Tget_class(type.id());
    }

    // Whole dataset, converted by HDF5 to T
    template <typename T>
    void read(T* buffer) const {
        detail::check(H5Dread(handle_.id(), detail::memory_type<T>(),
                              H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer), "H5Dread");
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check(H5Dwrite(handle_.id(), detail::memory_type<T>(),
                               H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer), "H5Dwrite");
    }

private:
    Handle<H5Dclose> handle_;
};

// =============================================================================
// File
// =============================================================================

class File {
public:
    // Existing file, read-only unless flags says otherwise
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY) {
        detail::silence_auto_print();
        handle_ = Handle<H5Fclose>(
            detail::check_id(H5Fopen(path.c_str(), flags, H5P_DEFAULT), "cannot open " + path));
    }

    // New file, replacing any file at path
    static File create(const std::string& path) {
        detail::silence_auto_print();
        return File(detail::check_id(
            H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT),
            "cannot create " + path));
    }

    [[nodiscard]] bool exists(const std::string& name) const {
        return H5Lexists(handle_.id(), name.c_str(), H5P_DEFAULT) > 0;
    }

    void unlink(const std::string& name) {
        detail::check(H5Ldelete(handle_.id(), name.c_str(), H5P_DEFAULT), "H5Ldelete " + name);
    }

    [[nodiscard]] Dataset open_dataset(const std::string& name) const {
        return Dataset(detail::check_id(
            H5Dopen2(handle_.id(), name.c_str(), H5P_DEFAULT), "H5Dopen " + name));
    }

    // Stored with the native layout of T
    template <typename T>
    Dataset create_dataset(const std::string& name, const std::vector<hsize_t>& dims) {
        SpaceHandle space(detail::check_id(
            H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
            "H5Screate_simple"));
        return Dataset(detail::check_id(
            H5Dcreate2(handle_.id(), name.c_str(), detail::memory_type<T>(), space.id(),
                       H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
            "H5Dcreate " + name));
    }

    void flush() {
        detail::check(H5Fflush(handle_.id(), H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    explicit File(hid_t id) noexcept : handle_(id) {}

    Handle<H5Fclose> handle_;
};

} // namespace psm::io::h5

#endif // PSM_HAS_HDF5
