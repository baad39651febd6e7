#pragma once

#include <cmath>
#include <cstdint>

namespace smp {

// Internal canonical time unit: microseconds on the virtual timeline
using TimeUS = int64_t;

constexpr TimeUS kMicrosPerSecond = 1000000;

// Seconds appear only at the wire boundary (word timestamps, config).
// Round to nearest so 2.0s round-trips exactly.
inline TimeUS seconds_to_us(double seconds) {
    return static_cast<TimeUS>(std::llround(seconds * static_cast<double>(kMicrosPerSecond)));
}

inline double us_to_seconds(TimeUS us) {
    return static_cast<double>(us) / static_cast<double>(kMicrosPerSecond);
}

// Frames at a sample rate → microseconds (floor)
inline TimeUS frames_to_us(int64_t frames, int32_t sample_rate) {
    return (frames * kMicrosPerSecond) / sample_rate;
}

inline int64_t us_to_frames(TimeUS us, int32_t sample_rate) {
    return (us * sample_rate) / kMicrosPerSecond;
}

// Half-open time span [start, end)
struct TimeSpan {
    TimeUS start = 0;
    TimeUS end = 0;

    TimeUS duration() const { return end - start; }
    bool empty() const { return end <= start; }
    bool contains(TimeUS t) const { return start <= t && t < end; }

    bool operator==(const TimeSpan& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const TimeSpan& other) const { return !(*this == other); }
};

} // namespace smp
