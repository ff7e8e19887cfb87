// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/seeded_rng.h>

#include <art_dna/stats.h>

#include <cmath>

namespace art_dna {

SeededRNG::SeededRNG(uint32_t seed)
    : initial_seed_(seed), state_(seed) {}

double SeededRNG::next() {
    state_ += 0x6D2B79F5u;
    uint32_t t = state_;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    t ^= t >> 14;
    return static_cast<double>(t) / 4294967296.0;
}

int64_t SeededRNG::next_int(int64_t min, int64_t max) {
    if (max < min) {
        throw InvalidInput(CErrorFormatter::InputError("next_int range", "max < min"));
    }
    double span = static_cast<double>(max - min + 1);
    return static_cast<int64_t>(std::floor(next() * span)) + min;
}

double SeededRNG::next_float(double min, double max) {
    return next() * (max - min) + min;
}

bool SeededRNG::next_boolean(double probability) {
    return next() < probability;
}

double SeededRNG::next_gaussian(double mean, double std_dev) {
    double u1 = next();
    double u2 = next();
    // log(0) is undefined; next() can return exactly 0
    while (u1 <= 0.0) {
        u1 = next();
    }
    double z0 = std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * PI * u2);
    return z0 * std_dev + mean;
}

void SeededRNG::reset() {
    state_ = initial_seed_;
}

SeededRNG SeededRNG::derive(uint32_t offset) const {
    return SeededRNG(initial_seed_ + offset);
}

SeededRNG SeededRNG::clone() const {
    SeededRNG copy(initial_seed_);
    copy.state_ = state_;
    return copy;
}

} // namespace art_dna
