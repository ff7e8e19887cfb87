// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STATS_H
#define ARTDNA_STATS_H

#include <algorithm>
#include <cmath>
#include <vector>

namespace art_dna {

static constexpr double PI = 3.14159265358979323846;

/** Mean of a sample, 0 for an empty sample */
inline double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

/** Population variance, 0 for an empty sample */
inline double Variance(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double mean = Mean(values);
    double sum = 0.0;
    for (double v : values) sum += (v - mean) * (v - mean);
    return sum / static_cast<double>(values.size());
}

inline double StdDev(const std::vector<double>& values) {
    return std::sqrt(Variance(values));
}

inline double Clamp01(double value) {
    return std::min(1.0, std::max(0.0, value));
}

inline double Lerp(double a, double b, double t) {
    return a * (1.0 - t) + b * t;
}

} // namespace art_dna

#endif // ARTDNA_STATS_H
