#pragma once

#include <cmath>
#include <iostream>

// Minimal assertion helpers shared by the *_test executables.
// Each test main returns TestExitCode(): 0 when every CHECK passed.

inline int& TestFailures()
{
    static int failures = 0;
    return failures;
}

inline int TestExitCode(const char* suite)
{
    if (TestFailures() == 0) {
        std::cout << "[TEST] " << suite << ": all checks passed" << std::endl;
        return 0;
    }
    std::cerr << "[TEST] " << suite << ": " << TestFailures() << " check(s) FAILED" << std::endl;
    return 1;
}

#define CHECK(cond)                                                                          \
    do {                                                                                     \
        if (!(cond)) {                                                                       \
            std::cerr << "[TEST] FAIL " << __FILE__ << ":" << __LINE__ << ": " #cond << std::endl; \
            TestFailures()++;                                                                \
        }                                                                                    \
    } while (0)

#define CHECK_NEAR(a, b, eps)                                                                \
    do {                                                                                     \
        const double checkA_ = static_cast<double>(a);                                       \
        const double checkB_ = static_cast<double>(b);                                       \
        if (!(std::fabs(checkA_ - checkB_) <= (eps))) {                                      \
            std::cerr << "[TEST] FAIL " << __FILE__ << ":" << __LINE__ << ": " #a " = " << checkA_ \
                      << " vs " #b " = " << checkB_ << std::endl;                            \
            TestFailures()++;                                                                \
        }                                                                                    \
    } while (0)

#define CHECK_THROWS(expr, ExceptionType)                                                    \
    do {                                                                                     \
        bool checkThrew_ = false;                                                            \
        try {                                                                                \
            expr;                                                                            \
        } catch (const ExceptionType&) {                                                     \
            checkThrew_ = true;                                                              \
        }                                                                                    \
        if (!checkThrew_) {                                                                  \
            std::cerr << "[TEST] FAIL " << __FILE__ << ":" << __LINE__ << ": " #expr         \
                      << " did not throw " #ExceptionType << std::endl;                      \
            TestFailures()++;                                                                \
        }                                                                                    \
    } while (0)
