// Assert handler with stack trace support

#include "assert_handler.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <signal.h>

#if defined(__APPLE__) || defined(__GLIBC__)
#define LECTOR_HAVE_BACKTRACE 1
#include <execinfo.h>
#include <cxxabi.h>
#endif

// Flag to prevent recursive abort handling
static volatile sig_atomic_t g_handling_abort = 0;

#ifdef LECTOR_HAVE_BACKTRACE
// Extract the mangled name from a backtrace_symbols() line.
//   macOS: "1  liblector.dylib  0x123  _ZN6lector3FooEv + 42"
//   glibc: "./lector(_ZN6lector3FooEv+0x2a) [0x55d4c3]"
static bool mangled_name(const char* symbol, char* out, size_t outsize) {
#ifdef __APPLE__
    const char* start = std::strstr(symbol, " _Z");
    if (!start) return false;
    start += 1;
    const char* end = start;
    while (*end && *end != ' ' && *end != '+') end++;
#else
    const char* start = std::strchr(symbol, '(');
    if (!start) return false;
    start += 1;
    const char* end = start;
    while (*end && *end != '+' && *end != ')') end++;
#endif
    size_t len = static_cast<size_t>(end - start);
    if (len == 0 || len >= outsize) return false;
    std::memcpy(out, start, len);
    out[len] = '\0';
    return true;
}

static void print_stack_trace(int skip) {
    fprintf(stderr, "Stack trace:\n");
    fprintf(stderr, "─────────────────────────────────────────────────────────────────\n");

    void* callstack[64];
    int frames = backtrace(callstack, 64);
    char** symbols = backtrace_symbols(callstack, frames);

    if (symbols) {
        char mangled[512];
        for (int i = skip; i < frames; i++) {
            char* demangled = nullptr;
            if (mangled_name(symbols[i], mangled, sizeof(mangled))) {
                int status = 0;
                demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
                if (status != 0) demangled = nullptr;
            }
            fprintf(stderr, "  [%2d] %s\n", i - skip, demangled ? demangled : symbols[i]);
            free(demangled);
        }
        free(symbols);
    } else {
        fprintf(stderr, "  (unable to get stack trace)\n");
    }
    fprintf(stderr, "─────────────────────────────────────────────────────────────────\n");
}
#else
static void print_stack_trace(int) {
    fprintf(stderr, "  (stack trace not available on this platform)\n");
}
#endif

void lector_assert_fail(const char* expr, const char* msg, const char* file, int line, const char* func) {
    fprintf(stderr, "\n");
    fprintf(stderr, "╔══════════════════════════════════════════════════════════════╗\n");
    fprintf(stderr, "║                      ASSERTION FAILED                        ║\n");
    fprintf(stderr, "╚══════════════════════════════════════════════════════════════╝\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "  Expression: %s\n", expr);
    fprintf(stderr, "  Message:    %s\n", msg);
    fprintf(stderr, "  Location:   %s:%d\n", file, line);
    fprintf(stderr, "  Function:   %s\n", func);
    fprintf(stderr, "\n");

    // Skip this function and the caller's macro frame
    print_stack_trace(2);

    fprintf(stderr, "\n");
    fflush(stderr);

    _exit(134);  // 128 + SIGABRT, same status abort() would give
}

// SIGABRT handler - catches abort() from standard assert() and other sources
static void sigabrt_handler(int sig) {
    (void)sig;

    if (g_handling_abort) {
        _exit(134);
    }
    g_handling_abort = 1;

    fprintf(stderr, "\n");
    fprintf(stderr, "╔══════════════════════════════════════════════════════════════╗\n");
    fprintf(stderr, "║                      ABORT CAUGHT                            ║\n");
    fprintf(stderr, "╚══════════════════════════════════════════════════════════════╝\n");
    fprintf(stderr, "\n");
    fprintf(stderr, "  A standard assert() or abort() was triggered.\n");
    fprintf(stderr, "  (Use LECTOR_ASSERT for better diagnostics)\n");
    fprintf(stderr, "\n");

    print_stack_trace(1);

    fprintf(stderr, "\n");
    fflush(stderr);

    _exit(134);
}

void lector_install_abort_handler() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = sigabrt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGABRT, &sa, nullptr);
}
