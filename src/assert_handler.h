#pragma once

// Invariant checks with stack trace
// Usage: LECTOR_ASSERT(condition, "message with context")
// On failure: prints message, file:line, stack trace, then exits with 134

#include <cstdlib>

#ifdef __cplusplus
extern "C" {
#endif

// Called on assert failure - prints stack trace and exits
void lector_assert_fail(const char* expr, const char* msg, const char* file, int line, const char* func);

// Install SIGABRT handler to catch standard assert() and abort()
// Call this early in main()
void lector_install_abort_handler();

#ifdef __cplusplus
}
#endif

// Always enabled, independent of NDEBUG
#define LECTOR_ASSERT(expr, msg) \
    do { \
        if (!(expr)) { \
            lector_assert_fail(#expr, msg, __FILE__, __LINE__, __func__); \
        } \
    } while (0)

// Unconditional failure
#define LECTOR_FAIL(msg) \
    lector_assert_fail("(unconditional)", msg, __FILE__, __LINE__, __func__)
