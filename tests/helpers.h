#ifndef SHALLOWNET_TEST_HELPERS_H
#define SHALLOWNET_TEST_HELPERS_H

#include <cmath>
#include <string>
#include <iostream>
#include <Eigen/Dense>

static int g_fail_count = 0;

#define EXPECT_TRUE(cond, msg) do { \
    if (!(cond)) { \
        std::cerr << "[FAIL] " << msg << " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
    } \
} while(0)

#define EXPECT_CLOSE(val, exp, eps, msg) do { \
    if (!(std::fabs((val) - (exp)) <= (eps))) { \
        std::cerr << "[FAIL] " << msg << " got=" << (val) << " expected=" << (exp) \
                  << " tol=" << (eps) << " (at " << __FILE__ << ":" << __LINE__ << ")\n"; \
        g_fail_count++; \
    } \
} while(0)

// Passes when the statement throws the given exception type
#define EXPECT_THROWS(stmt, exception_type, msg) do { \
    bool _thrown = false; \
    try { stmt; } catch (const exception_type&) { _thrown = true; } \
    EXPECT_TRUE(_thrown, std::string(msg) + " should throw " #exception_type); \
} while(0)

#define TEST_HEADER(name) std::cout << "\n=== " << name << " ===\n"

inline void expect_matrix_close(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b, double eps, const std::string& msg) {
    EXPECT_TRUE(a.rows() == b.rows() && a.cols() == b.cols(), msg + " shape mismatch");
    if (a.rows() != b.rows() || a.cols() != b.cols()) return;
    for (int i = 0; i < a.rows(); ++i) {
        for (int j = 0; j < a.cols(); ++j) {
            EXPECT_CLOSE(a(i, j), b(i, j), eps, msg + " at (" + std::to_string(i) + "," + std::to_string(j) + ")");
        }
    }
}

inline int report_results(const char* suite) {
    if (g_fail_count == 0) {
        std::cout << "\n" << suite << ": ALL TESTS PASSED\n";
        return 0;
    }
    std::cerr << "\n" << suite << ": TESTS FAILED: " << g_fail_count << "\n";
    return 1;
}

#endif // SHALLOWNET_TEST_HELPERS_H
