#pragma once

// =============================================================================
// PSM - C API Test Framework (Core)
// =============================================================================
//
// Header-only registration, runner and assertions. Each test file is one
// executable registered with ctest.
//
// Cases are stored by __COUNTER__ slot, so registration order is source
// order regardless of static initialization order.
//
// CLI:
//   -k, --filter <s>   Run cases whose "suite::name" contains <s>
//   -x, --fail-fast    Stop at the first failure
//   -v, --verbose      Print every case, not only failures and skips
//   --list             Print case names and exit
//
// PSM_TEST_FILTER in the environment acts like -k.
// =============================================================================

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace psm::test {

constexpr std::size_t MAX_CASES_PER_FILE = 512;

// Thrown by a failing assertion
class TestException : public std::exception {
public:
    TestException(const char* file, int line, std::string message,
                  std::string expected = {}, std::string actual = {})
        : file_(file), line_(line), message_(std::move(message)),
          expected_(std::move(expected)), actual_(std::move(actual)) {
        what_ = std::string(file_) + ":" + std::to_string(line_) + ": " + message_;
    }

    const char* what() const noexcept override { return what_.c_str(); }
    const char* file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    const char* file_;
    int line_;
    std::string message_;
    std::string expected_;
    std::string actual_;
    std::string what_;
};

class SkipException : public std::exception {
public:
    explicit SkipException(std::string reason) : reason_(std::move(reason)) {}
    const char* what() const noexcept override { return reason_.c_str(); }

private:
    std::string reason_;
};

struct Case {
    void (*func)() = nullptr;
    const char* name = nullptr;
    const char* suite = nullptr;
    const char* file = nullptr;
    int line = 0;

    std::string full_name() const {
        return suite ? std::string(suite) + "::" + name : std::string(name);
    }
};

namespace detail {

struct Registry {
    std::array<Case, MAX_CASES_PER_FILE> cases{};
    std::size_t used = 0;
    const char* open_suite = nullptr;

    static Registry& get() {
        static Registry r;
        return r;
    }

    void add(std::size_t slot, Case c) {
        cases[slot] = c;
        if (slot + 1 > used) {
            used = slot + 1;
        }
    }
};

// int8_t modality codes must print as numbers
template <typename T>
std::string show(const T& v) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, std::int8_t> || std::is_same_v<U, std::uint8_t>) {
        return std::to_string(static_cast<int>(v));
    } else if constexpr (std::is_enum_v<U>) {
        return std::to_string(static_cast<long long>(v));
    } else if constexpr (std::is_same_v<U, std::nullptr_t>) {
        return "nullptr";
    } else if constexpr (std::is_pointer_v<U>) {
        if constexpr (std::is_same_v<U, const char*> || std::is_same_v<U, char*>) {
            return v ? "\"" + std::string(v) + "\"" : "nullptr";
        } else {
            if (v == nullptr) {
                return "nullptr";
            }
            std::ostringstream os;
            os << static_cast<const void*>(v);
            return os.str();
        }
    } else if constexpr (std::is_same_v<U, std::string>) {
        return "\"" + v + "\"";
    } else {
        std::ostringstream os;
        os.precision(17);
        os << std::boolalpha << v;
        return os.str();
    }
}

} // namespace detail

// =============================================================================
// Runner
// =============================================================================

struct Options {
    const char* filter = nullptr;
    bool fail_fast = false;
    bool verbose = false;
    bool list = false;
};

inline Options parse_args(int argc, char* argv[]) {
    Options opt;
    opt.filter = std::getenv("PSM_TEST_FILTER");
    auto is = [](const char* arg, const char* short_name, const char* long_name) {
        return std::strcmp(arg, short_name) == 0 || std::strcmp(arg, long_name) == 0;
    };
    for (int i = 1; i < argc; ++i) {
        if (is(argv[i], "-k", "--filter") && i + 1 < argc) {
            opt.filter = argv[++i];
        } else if (is(argv[i], "-x", "--fail-fast")) {
            opt.fail_fast = true;
        } else if (is(argv[i], "-v", "--verbose")) {
            opt.verbose = true;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            opt.list = true;
        } else {
            std::fprintf(stderr, "usage: %s [-k substr] [-x] [-v] [--list]\n", argv[0]);
            std::exit(2);
        }
    }
    return opt;
}

inline int run_all(const Options& opt) {
    const auto& reg = detail::Registry::get();

    std::vector<const Case*> selected;
    for (std::size_t i = 0; i < reg.used; ++i) {
        const Case& c = reg.cases[i];
        if (c.func == nullptr) {
            continue;
        }
        if (opt.filter && c.full_name().find(opt.filter) == std::string::npos) {
            continue;
        }
        selected.push_back(&c);
    }

    if (opt.list) {
        for (const Case* c : selected) {
            std::printf("%s  (%s:%d)\n", c->full_name().c_str(), c->file, c->line);
        }
        return 0;
    }

    int passed = 0;
    int failed = 0;
    int skipped = 0;
    const auto t0 = std::chrono::steady_clock::now();

    for (const Case* c : selected) {
        const std::string name = c->full_name();
        try {
            c->func();
            ++passed;
            if (opt.verbose) {
                std::printf("PASS  %s\n", name.c_str());
            }
        } catch (const SkipException& e) {
            ++skipped;
            std::printf("SKIP  %s: %s\n", name.c_str(), e.what());
        } catch (const TestException& e) {
            ++failed;
            std::printf("FAIL  %s\n      %s:%d: %s\n", name.c_str(),
                        e.file(), e.line(), e.message().c_str());
            if (!e.expected().empty() || !e.actual().empty()) {
                std::printf("      expected: %s\n      actual:   %s\n",
                            e.expected().c_str(), e.actual().c_str());
            }
        } catch (const std::exception& e) {
            ++failed;
            std::printf("ERROR %s\n      uncaught exception: %s\n", name.c_str(), e.what());
        }

        if (failed > 0 && opt.fail_fast) {
            break;
        }
    }

    const double ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    std::printf("\n%d passed, %d failed, %d skipped in %.1f ms\n", passed, failed, skipped, ms);
    return failed == 0 ? 0 : 1;
}

} // namespace psm::test

// =============================================================================
// Assertions
// =============================================================================

#define PSM_DETAIL_FAIL(...) \
    throw ::psm::test::TestException(__FILE__, __LINE__, __VA_ARGS__)

#define PSM_DETAIL_ASSERT_CMP(a, b, op) \
    do { \
        const auto psm_lhs_ = (a); \
        const auto psm_rhs_ = (b); \
        if (!(psm_lhs_ op psm_rhs_)) { \
            PSM_DETAIL_FAIL(#a " " #op " " #b, \
                #op " " + ::psm::test::detail::show(psm_rhs_), \
                ::psm::test::detail::show(psm_lhs_)); \
        } \
    } while (0)

#define PSM_ASSERT_EQ(expected, actual) \
    do { \
        const auto psm_exp_ = (expected); \
        const auto psm_act_ = (actual); \
        if (!(psm_exp_ == psm_act_)) { \
            PSM_DETAIL_FAIL(#expected " == " #actual, \
                ::psm::test::detail::show(psm_exp_), \
                ::psm::test::detail::show(psm_act_)); \
        } \
    } while (0)

#define PSM_ASSERT_LT(a, b) PSM_DETAIL_ASSERT_CMP(a, b, <)
#define PSM_ASSERT_LE(a, b) PSM_DETAIL_ASSERT_CMP(a, b, <=)
#define PSM_ASSERT_GE(a, b) PSM_DETAIL_ASSERT_CMP(a, b, >=)

#define PSM_ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            PSM_DETAIL_FAIL("expected true: " #expr); \
        } \
    } while (0)

#define PSM_ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            PSM_DETAIL_FAIL("expected false: " #expr); \
        } \
    } while (0)

#define PSM_ASSERT_NULL(p) \
    do { \
        if ((p) != nullptr) { \
            PSM_DETAIL_FAIL("expected nullptr: " #p); \
        } \
    } while (0)

#define PSM_ASSERT_NOT_NULL(p) \
    do { \
        if ((p) == nullptr) { \
            PSM_DETAIL_FAIL("expected non-null: " #p); \
        } \
    } while (0)

#define PSM_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        const double psm_exp_ = static_cast<double>(expected); \
        const double psm_act_ = static_cast<double>(actual); \
        const double psm_tol_ = static_cast<double>(tolerance); \
        if (!(std::fabs(psm_exp_ - psm_act_) <= psm_tol_)) { \
            PSM_DETAIL_FAIL("|" #expected " - " #actual "| <= " #tolerance, \
                ::psm::test::detail::show(psm_exp_), \
                ::psm::test::detail::show(psm_act_)); \
        } \
    } while (0)

#define PSM_ASSERT_STR_EQ(expected, actual) \
    PSM_ASSERT_EQ(std::string(expected), std::string(actual))

#define PSM_ASSERT_STR_CONTAINS(haystack, needle) \
    do { \
        const std::string psm_hay_(haystack); \
        const std::string psm_ndl_(needle); \
        if (psm_hay_.find(psm_ndl_) == std::string::npos) { \
            PSM_DETAIL_FAIL(#haystack " contains " #needle, \
                "\"" + psm_ndl_ + "\"", "\"" + psm_hay_ + "\""); \
        } \
    } while (0)

#define PSM_SKIP_IF(condition, reason) \
    do { \
        if (condition) { \
            throw ::psm::test::SkipException(reason); \
        } \
    } while (0)

// =============================================================================
// Registration
// =============================================================================

#define PSM_TEST_BEGIN \
    namespace { \
    constexpr std::size_t psm_counter_base_ = __COUNTER__;

#define PSM_TEST_SUITE(name) \
    namespace psm_suite_##name { \
    [[maybe_unused]] const bool psm_suite_open_ = [] { \
        ::psm::test::detail::Registry::get().open_suite = #name; \
        return true; \
    }();

#define PSM_TEST_CASE(name) \
    void psm_case_##name(); \
    [[maybe_unused]] const bool psm_reg_##name = [] { \
        constexpr std::size_t slot = __COUNTER__ - psm_counter_base_ - 1; \
        static_assert(slot < ::psm::test::MAX_CASES_PER_FILE, "too many cases in one file"); \
        auto& reg = ::psm::test::detail::Registry::get(); \
        reg.add(slot, {psm_case_##name, #name, reg.open_suite, __FILE__, __LINE__}); \
        return true; \
    }(); \
    void psm_case_##name()

#define PSM_TEST_SUITE_END \
    [[maybe_unused]] const bool psm_suite_close_ = [] { \
        ::psm::test::detail::Registry::get().open_suite = nullptr; \
        return true; \
    }(); \
    }

#define PSM_TEST_END \
    }

#define PSM_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        return ::psm::test::run_all(::psm::test::parse_args(argc, argv)); \
    }
