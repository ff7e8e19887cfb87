// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_FEATURE_VECTOR_H
#define ARTDNA_FEATURE_VECTOR_H

/**
 * Fixed-length feature vectors for the three DNA tiers.
 *
 *   Stroke   - 30 floats, indexed by StrokeFeature
 *   Image    - 512 floats, five bands of edge/histogram/structure slots
 *   Temporal - 32 floats, indexed by TemporalFeature
 *
 * Storage and wire form is the flat float buffer. Field access goes
 * through the tier's own enum, so a temporal field cannot index a
 * stroke vector.
 */

#include <art_dna/dna_errors.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <vector>

namespace art_dna {

static constexpr size_t STROKE_DIMENSIONS = 30;
static constexpr size_t IMAGE_DIMENSIONS = 512;
static constexpr size_t TEMPORAL_DIMENSIONS = 32;

enum class StrokeFeature : size_t {
    // Geometric (0-9)
    MEAN_X = 0,
    MEAN_Y,
    WIDTH,
    HEIGHT,
    ASPECT_RATIO,
    AREA,
    PERIMETER,
    COMPACTNESS,
    ELONGATION,
    ORIENTATION,

    // Statistical (10-19)
    X_VARIANCE,
    Y_VARIANCE,
    X_SKEWNESS,
    Y_SKEWNESS,
    X_KURTOSIS,
    Y_KURTOSIS,
    POINT_DENSITY,
    CURVATURE_MEAN,
    CURVATURE_STD,
    CORNER_COUNT,

    // Dynamic (20-29)
    AVG_VELOCITY,
    MAX_VELOCITY,
    AVG_ACCELERATION,
    MAX_ACCELERATION,
    PRESSURE_MEAN,
    PRESSURE_STD,
    TILT_MEAN,
    TWIST_MEAN,
    DURATION,
    PAUSE_COUNT
};

enum class TemporalFeature : size_t {
    // Learning (0-9)
    SESSION_COUNT = 0,
    TOTAL_STROKES,
    AVG_STROKE_LENGTH,
    PREFERRED_VELOCITY,
    PREFERRED_PRESSURE,
    TOOL_DIVERSITY,
    COLOR_PALETTE_SIZE,
    COMPOSITION_BIAS,
    REVISION_RATE,
    COMPLETION_RATE,

    // Fatigue (10-19)
    CURRENT_FATIGUE_LEVEL,
    STROKE_CONSISTENCY,
    ERROR_FREQUENCY,
    UNDO_RATE,
    PAUSE_FREQUENCY,
    VELOCITY_VARIANCE,
    PRESSURE_STABILITY,
    SESSION_DURATION,
    BREAK_COUNT,
    FOCUS_SCORE,

    // Style evolution (20-29)
    STYLE_DRIFT_RATE,
    EXPLORATION_SCORE,
    REFINEMENT_SCORE,
    EXPERIMENTATION_RATE,
    COMFORT_ZONE_RADIUS,
    NOVELTY_SEEKING,
    PATTERN_REPETITION,
    CREATIVE_BURST_COUNT,
    DELIBERATE_PRACTICE_TIME,
    FLOW_STATE_DURATION,

    RESERVED_1,
    RESERVED_2
};

/** Named slots and band offsets of the image vector */
enum class ImageFeature : size_t {
    EDGE_HORIZONTAL = 0,        // block 1: mean |dGray| between vertical neighbours
    EDGE_VERTICAL = 1,          // block 1: mean |dGray| between horizontal neighbours
    ORIENTATION_HISTOGRAM = 64, // block 2: 8 bins
    RGB_HISTOGRAM = 128,        // block 3: 3 x 16 bins
    PATTERN_SLOTS = 176,        // block 3 remainder
    STRUCTURE_BAND = 256,       // block 4
    SEMANTIC_BAND = 384         // block 5
};

static constexpr size_t IMAGE_BLOCK_SIZE_SMALL = 64;
static constexpr size_t IMAGE_BLOCK_SIZE_LARGE = 128;
static constexpr size_t ORIENTATION_BINS = 8;
static constexpr size_t COLOR_HISTOGRAM_BINS = 16;

template <typename Field, size_t N>
class FeatureVector {
public:
    static constexpr size_t SIZE = N;

    FeatureVector() { values_.fill(0.0f); }

    float get(Field field) const { return values_[static_cast<size_t>(field)]; }
    void set(Field field, double value) { values_[static_cast<size_t>(field)] = static_cast<float>(value); }

    float& operator[](size_t index) { return values_[index]; }
    const float& operator[](size_t index) const { return values_[index]; }

    size_t size() const { return N; }
    const float* data() const { return values_.data(); }
    float* data() { return values_.data(); }

    typename std::array<float, N>::iterator begin() { return values_.begin(); }
    typename std::array<float, N>::iterator end() { return values_.end(); }
    typename std::array<float, N>::const_iterator begin() const { return values_.begin(); }
    typename std::array<float, N>::const_iterator end() const { return values_.end(); }

    std::vector<float> to_vector() const { return std::vector<float>(values_.begin(), values_.end()); }

    /**
     * Build from a flat buffer.
     * @throws DimensionMismatch if values.size() != N
     */
    static FeatureVector from_vector(const std::vector<float>& values) {
        if (values.size() != N) {
            throw DimensionMismatch(N, values.size());
        }
        FeatureVector result;
        for (size_t i = 0; i < N; i++) {
            result.values_[i] = values[i];
        }
        return result;
    }

    /** True if every slot is a finite number */
    bool is_finite() const {
        for (float v : values_) {
            if (!std::isfinite(v)) return false;
        }
        return true;
    }

    bool operator==(const FeatureVector& other) const { return values_ == other.values_; }
    bool operator!=(const FeatureVector& other) const { return values_ != other.values_; }

private:
    std::array<float, N> values_;
};

using StrokeVector = FeatureVector<StrokeFeature, STROKE_DIMENSIONS>;
using ImageVector = FeatureVector<ImageFeature, IMAGE_DIMENSIONS>;
using TemporalVector = FeatureVector<TemporalFeature, TEMPORAL_DIMENSIONS>;

} // namespace art_dna

#endif // ARTDNA_FEATURE_VECTOR_H
