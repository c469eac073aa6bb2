// =============================================================================
// PSM - HDF5 I/O Tests
// =============================================================================
//
// Functions tested:
//   - psm_io_psi_shape / psm_io_read_psi / psm_io_write_psi
//   - psm_io_write_assignments / psm_io_read_assignments
//
// Skipped when the library was built without HDF5.
//
// =============================================================================

#include "test.hpp"

extern "C" {
#include "psm/binding/c_api/io.h"
#include "psm/binding/c_api/modality.h"
}

#include <filesystem>
#include <string>
#include <vector>

using namespace psm::test;

namespace {

bool hdf5_available() {
    return std::string(psm_get_build_config()).find("+hdf5") != std::string::npos;
}

/// Removes the file when going out of scope
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_((std::filesystem::temp_directory_path() / name).string()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const char* c_str() const { return path_.c_str(); }

private:
    std::string path_;
};

} // namespace

PSM_TEST_BEGIN

// =============================================================================
// PSI Matrices
// =============================================================================

PSM_TEST_SUITE(psi)

PSM_TEST_CASE(unavailable_without_hdf5) {
    PSM_SKIP_IF(hdf5_available(), "built with HDF5");

    psm_index_t rows = 0, cols = 0;
    PSM_ASSERT_EQ(psm_io_psi_shape("/nonexistent.h5", "psi", &rows, &cols),
                  PSM_ERROR_FEATURE_UNAVAILABLE);
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_ERROR_FEATURE_UNAVAILABLE);
    PSM_ASSERT_STR_CONTAINS(psm_get_last_error(), "without HDF5");

    int8_t codes[2] = {0, 1};
    PSM_ASSERT_EQ(psm_io_write_assignments("/nonexistent.h5", "codes", codes, 2),
                  PSM_ERROR_FEATURE_UNAVAILABLE);
    psm_clear_error();
}

PSM_TEST_CASE(write_then_read_preserves_values_and_missing) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_psi.h5");

    Random rng(71);
    EigenDense psi = random_psi(6, 9, rng, 0.25);
    auto mat = wrap(psi);
    PSM_ASSERT_EQ(psm_io_write_psi(file.c_str(), "psi", mat), PSM_OK);

    psm_index_t rows = 0, cols = 0;
    PSM_ASSERT_EQ(psm_io_psi_shape(file.c_str(), "psi", &rows, &cols), PSM_OK);
    PSM_ASSERT_EQ(rows, psm_index_t(6));
    PSM_ASSERT_EQ(cols, psm_index_t(9));

    std::vector<psm_real_t> back(6 * 9);
    PSM_ASSERT_EQ(psm_io_read_psi(file.c_str(), "psi", back.data(), back.size()), PSM_OK);

    std::vector<psm_real_t> expected(psi.data(), psi.data() + psi.size());
    PSM_ASSERT_TRUE(vectors_equal(expected, back, 0.0));
}

PSM_TEST_CASE(write_packs_strided_views) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_strided.h5");

    std::vector<psm_real_t> buffer = {
        0.1, 0.2, 9.0,
        0.3, 0.4, 9.0
    };
    Dense mat;
    PSM_ASSERT_EQ(psm_dense_wrap(mat.ptr(), 2, 2, buffer.data(), 3), PSM_OK);
    PSM_ASSERT_EQ(psm_io_write_psi(file.c_str(), "psi", mat), PSM_OK);

    std::vector<psm_real_t> back(4);
    PSM_ASSERT_EQ(psm_io_read_psi(file.c_str(), "psi", back.data(), back.size()), PSM_OK);
    PSM_ASSERT_TRUE(vectors_equal({0.1, 0.2, 0.3, 0.4}, back, 0.0));
}

PSM_TEST_CASE(read_rejects_small_buffer) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_small.h5");

    EigenDense psi = constant_matrix(3, 3, 0.5);
    auto mat = wrap(psi);
    PSM_ASSERT_EQ(psm_io_write_psi(file.c_str(), "psi", mat), PSM_OK);

    std::vector<psm_real_t> back(4);
    PSM_ASSERT_EQ(psm_io_read_psi(file.c_str(), "psi", back.data(), back.size()),
                  PSM_ERROR_DIMENSION_MISMATCH);
    psm_clear_error();
}

PSM_TEST_CASE(missing_file) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    psm_index_t rows = 0, cols = 0;
    PSM_ASSERT_EQ(psm_io_psi_shape("/nonexistent/psm_missing.h5", "psi", &rows, &cols),
                  PSM_ERROR_FILE_NOT_FOUND);
    psm_clear_error();
}

PSM_TEST_CASE(missing_dataset) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_nodset.h5");

    EigenDense psi = constant_matrix(2, 2, 0.5);
    auto mat = wrap(psi);
    PSM_ASSERT_EQ(psm_io_write_psi(file.c_str(), "psi", mat), PSM_OK);

    psm_index_t rows = 0, cols = 0;
    PSM_ASSERT_EQ(psm_io_psi_shape(file.c_str(), "other", &rows, &cols), PSM_ERROR_IO_ERROR);
    PSM_ASSERT_STR_CONTAINS(psm_get_last_error(), "other");
    psm_clear_error();
}

PSM_TEST_CASE(integer_dataset_is_not_a_psi_matrix) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_int.h5");

    std::vector<int8_t> codes = {0, 1, 2};
    PSM_ASSERT_EQ(psm_io_write_assignments(file.c_str(), "codes", codes.data(), codes.size()),
                  PSM_OK);

    std::vector<psm_real_t> back(3);
    PSM_ASSERT_EQ(psm_io_read_psi(file.c_str(), "codes", back.data(), back.size()),
                  PSM_ERROR_TYPE_ERROR);
    psm_clear_error();
}

PSM_TEST_SUITE_END

// =============================================================================
// Assignments
// =============================================================================

PSM_TEST_SUITE(assignments)

PSM_TEST_CASE(estimate_write_read) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_assign.h5");

    Random rng(72);
    EigenDense psi = psi_matrix(20, {Shape::Low, Shape::High, Shape::Middle}, rng);
    auto mat = wrap(psi);
    PSM_ASSERT_EQ(psm_io_write_psi(file.c_str(), "psi", mat), PSM_OK);

    Estimator est;
    PSM_ASSERT_EQ(psm_estimator_create(est.ptr(), 0.2, 0.8), PSM_OK);
    std::vector<int8_t> codes(3);
    PSM_ASSERT_EQ(psm_modality_estimate(est, mat, codes.data(), 3), PSM_OK);

    // Written beside the PSI matrix, which must survive
    PSM_ASSERT_EQ(psm_io_write_assignments(file.c_str(), "modality", codes.data(), 3), PSM_OK);

    std::vector<int8_t> back(3, 99);
    PSM_ASSERT_EQ(psm_io_read_assignments(file.c_str(), "modality", back.data(), 3), PSM_OK);
    PSM_ASSERT_TRUE(codes == back);
    PSM_ASSERT_EQ(back[0], int8_t(PSM_MODALITY_EXCLUDED));

    psm_index_t rows = 0, cols = 0;
    PSM_ASSERT_EQ(psm_io_psi_shape(file.c_str(), "psi", &rows, &cols), PSM_OK);
    PSM_ASSERT_EQ(cols, psm_index_t(3));
}

PSM_TEST_CASE(rewrite_replaces_dataset) {
    PSM_SKIP_IF(!hdf5_available(), "built without HDF5");
    TempFile file("psm_test_io_rewrite.h5");

    std::vector<int8_t> first = {0, 0, 0, 0};
    std::vector<int8_t> second = {PSM_MODALITY_UNDEFINED, 5};
    PSM_ASSERT_EQ(psm_io_write_assignments(file.c_str(), "m", first.data(), 4), PSM_OK);
    PSM_ASSERT_EQ(psm_io_write_assignments(file.c_str(), "m", second.data(), 2), PSM_OK);

    std::vector<int8_t> back(2);
    PSM_ASSERT_EQ(psm_io_read_assignments(file.c_str(), "m", back.data(), 2), PSM_OK);
    PSM_ASSERT_TRUE(back == second);

    std::vector<int8_t> wrong(4);
    PSM_ASSERT_EQ(psm_io_read_assignments(file.c_str(), "m", wrong.data(), 4),
                  PSM_ERROR_DIMENSION_MISMATCH);
    psm_clear_error();
}

PSM_TEST_SUITE_END

PSM_TEST_END

PSM_TEST_MAIN()
