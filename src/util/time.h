// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_UTIL_TIME_H
#define ARTDNA_UTIL_TIME_H

#include <chrono>
#include <cstdint>

/** Wall clock, milliseconds since epoch (record timestamps) */
inline int64_t GetTimeMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch()).count();
}

/** Monotonic clock in fractional milliseconds, for measuring encode durations */
inline double GetSteadyMillis() {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now().time_since_epoch()).count();
}

#endif // ARTDNA_UTIL_TIME_H
