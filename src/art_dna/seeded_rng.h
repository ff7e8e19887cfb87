// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_SEEDED_RNG_H
#define ARTDNA_SEEDED_RNG_H

/**
 * Deterministic pseudo-random source (Mulberry32).
 *
 * Same seed and same call sequence give the same outputs on every
 * platform. Used wherever the engine needs randomness that must be
 * reproducible: image placeholder slots, k-means seeding, projector
 * initialization. Not thread-safe; give each thread its own instance
 * (see derive()).
 */

#include <art_dna/dna_errors.h>

#include <cstdint>
#include <vector>

namespace art_dna {

class SeededRNG {
public:
    explicit SeededRNG(uint32_t seed = 42);

    /** Uniform in [0, 1) */
    double next();

    /** Uniform integer in [min, max] inclusive */
    int64_t next_int(int64_t min, int64_t max);

    /** Uniform in [min, max) */
    double next_float(double min, double max);

    /** True with the given probability */
    bool next_boolean(double probability = 0.5);

    /** Normal sample via Box-Muller */
    double next_gaussian(double mean = 0.0, double std_dev = 1.0);

    /**
     * Pick one element uniformly.
     * @throws InvalidInput on an empty vector
     */
    template <typename T>
    const T& choice(const std::vector<T>& items) {
        if (items.empty()) {
            throw InvalidInput(CErrorFormatter::InputError("choice", "empty vector"));
        }
        return items[static_cast<size_t>(next_int(0, static_cast<int64_t>(items.size()) - 1))];
    }

    /** Fisher-Yates shuffle of a copy; the input is left untouched */
    template <typename T>
    std::vector<T> shuffle(const std::vector<T>& items) {
        std::vector<T> result(items);
        for (size_t i = result.size(); i-- > 1;) {
            size_t j = static_cast<size_t>(next_int(0, static_cast<int64_t>(i)));
            std::swap(result[i], result[j]);
        }
        return result;
    }

    /** Back to the initial seed */
    void reset();

    uint32_t get_state() const { return state_; }
    void set_state(uint32_t state) { state_ = state; }
    uint32_t get_seed() const { return initial_seed_; }

    /** Independent stream seeded with seed + offset */
    SeededRNG derive(uint32_t offset) const;

    /** Copy with the same seed and current state; advances independently */
    SeededRNG clone() const;

private:
    uint32_t initial_seed_;
    uint32_t state_;
};

} // namespace art_dna

#endif // ARTDNA_SEEDED_RNG_H
