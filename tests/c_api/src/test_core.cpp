// =============================================================================
// PSM - core.h Tests
// =============================================================================
//
// Functions tested:
//   - psm_get_version()
//   - psm_get_build_config()
//   - psm_get_last_error() / psm_get_last_error_code() / psm_clear_error()
//   - psm_is_ok() / psm_is_error()
//   - psm_set_log_level()
//   - psm_threading_set_num_threads() / psm_threading_get_num_threads()
//
// =============================================================================

#include "test.hpp"

extern "C" {
#include "psm/binding/c_api/threading.h"
}

#include <cstring>

using namespace psm::test;

PSM_TEST_BEGIN

// =============================================================================
// Version Information
// =============================================================================

PSM_TEST_SUITE(version_info)

PSM_TEST_CASE(get_version_matches_macros) {
    const char* version = psm_get_version();
    PSM_ASSERT_NOT_NULL(version);

    const std::string expected = std::to_string(PSM_C_API_VERSION_MAJOR) + "." +
                                 std::to_string(PSM_C_API_VERSION_MINOR) + "." +
                                 std::to_string(PSM_C_API_VERSION_PATCH);
    PSM_ASSERT_STR_EQ(expected, version);
}

PSM_TEST_CASE(get_version_is_stable) {
    const char* v1 = psm_get_version();
    const char* v2 = psm_get_version();
    PSM_ASSERT_EQ(v1, v2);
}

PSM_TEST_CASE(build_config_names_value_types) {
    const char* config = psm_get_build_config();
    PSM_ASSERT_NOT_NULL(config);
    PSM_ASSERT_STR_CONTAINS(config, PSM_REAL_TYPE_NAME);
    PSM_ASSERT_STR_CONTAINS(config, PSM_INDEX_TYPE_NAME);
}

PSM_TEST_SUITE_END

// =============================================================================
// Error State
// =============================================================================

PSM_TEST_SUITE(error_state)

PSM_TEST_CASE(clear_error_resets_state) {
    psm_clear_error();
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_OK);
    PSM_ASSERT_STR_EQ("No error", psm_get_last_error());
}

PSM_TEST_CASE(null_output_sets_last_error) {
    psm_clear_error();
    psm_error_t err = psm_threading_get_num_threads(nullptr);

    PSM_ASSERT_EQ(err, PSM_ERROR_NULL_POINTER);
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_ERROR_NULL_POINTER);
    PSM_ASSERT_TRUE(std::strlen(psm_get_last_error()) > 0);

    psm_clear_error();
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_OK);
}

PSM_TEST_CASE(is_ok_and_is_error) {
    PSM_ASSERT_EQ(psm_is_ok(PSM_OK), PSM_TRUE);
    PSM_ASSERT_EQ(psm_is_error(PSM_OK), PSM_FALSE);
    PSM_ASSERT_EQ(psm_is_ok(PSM_ERROR_INVALID_ARGUMENT), PSM_FALSE);
    PSM_ASSERT_EQ(psm_is_error(PSM_ERROR_IO_ERROR), PSM_TRUE);
}

PSM_TEST_CASE(successful_call_clears_previous_error) {
    psm_clear_error();
    PSM_ASSERT_EQ(psm_set_log_level(42), PSM_ERROR_INVALID_ARGUMENT);
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_ERROR_INVALID_ARGUMENT);
    PSM_ASSERT_STR_CONTAINS(psm_get_last_error(), "Log level");

    psm_size_t n = 0;
    PSM_ASSERT_EQ(psm_threading_get_num_threads(&n), PSM_OK);
    PSM_ASSERT_EQ(psm_get_last_error_code(), PSM_OK);
}

PSM_TEST_SUITE_END

// =============================================================================
// Logging
// =============================================================================

PSM_TEST_SUITE(logging)

PSM_TEST_CASE(set_log_level_accepts_every_level) {
    for (int32_t level = PSM_LOG_TRACE; level <= PSM_LOG_OFF; ++level) {
        PSM_ASSERT_EQ(psm_set_log_level(level), PSM_OK);
    }
    PSM_ASSERT_EQ(psm_set_log_level(PSM_LOG_WARN), PSM_OK);
}

PSM_TEST_CASE(set_log_level_rejects_out_of_range) {
    PSM_ASSERT_EQ(psm_set_log_level(-1), PSM_ERROR_INVALID_ARGUMENT);
    PSM_ASSERT_EQ(psm_set_log_level(PSM_LOG_OFF + 1), PSM_ERROR_INVALID_ARGUMENT);
    psm_clear_error();
}

PSM_TEST_SUITE_END

// =============================================================================
// Threading
// =============================================================================

PSM_TEST_SUITE(threading)

PSM_TEST_CASE(get_num_threads_is_positive) {
    psm_size_t n = 0;
    PSM_ASSERT_EQ(psm_threading_get_num_threads(&n), PSM_OK);
    PSM_ASSERT_GE(n, psm_size_t(1));
}

PSM_TEST_CASE(set_num_threads_zero_means_hardware) {
    PSM_ASSERT_EQ(psm_threading_set_num_threads(0), PSM_OK);
    psm_size_t n = 0;
    PSM_ASSERT_EQ(psm_threading_get_num_threads(&n), PSM_OK);
    PSM_ASSERT_GE(n, psm_size_t(1));
}

PSM_TEST_SUITE_END

PSM_TEST_END

PSM_TEST_MAIN()
