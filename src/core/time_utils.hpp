#pragma once
#include <chrono>
#include <cstdint>

namespace sping {
inline uint64_t monotonic_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

inline double ns_to_ms(uint64_t ns) {
    return static_cast<double>(ns) / 1e6;
}
}  // namespace sping
