#pragma once

#include <cstdio>
#include <cstdlib>

namespace smp {

// Simple logging - check SMP_LOG_LEVEL env var at runtime
// 0 = silent (default), 1 = warnings, 2 = debug
inline int smp_log_level() {
    static int level = -1;
    if (level < 0) {
        const char* env = std::getenv("SMP_LOG_LEVEL");
        level = env ? std::atoi(env) : 0;
    }
    return level;
}

} // namespace smp

#define SMP_LOG_WARN(...) do { if (smp::smp_log_level() >= 1) { fprintf(stderr, "[SMP WARN] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
#define SMP_LOG_DEBUG(...) do { if (smp::smp_log_level() >= 2) { fprintf(stderr, "[SMP] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
