// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DISTANCE_CALCULATOR_H
#define ARTDNA_DISTANCE_CALCULATOR_H

/**
 * Distances between DNA feature vectors and between whole sessions.
 *
 * Vector distance uses one of three metrics (Euclidean, cosine, Manhattan).
 * Session distance combines the stroke, image and temporal tiers with the
 * configured weights; a tier missing on either side counts as distance 1.0.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace art_dna {

/** The tiers of a session that take part in session-to-session distance */
struct CompositeDNA {
    std::vector<StrokeDNA> stroke_dna;
    std::optional<ImageDNA> image_dna;
    std::optional<TemporalDNA> temporal_dna;

    /** Strokes plus the latest image and temporal record of the session */
    static CompositeDNA FromSession(const DNASession& session);
};

struct MultiTierDistance {
    double overall_distance = 0.0;
    double stroke_distance = 0.0;
    double image_distance = 0.0;
    double temporal_distance = 0.0;
    DistanceWeights weights;
};

struct Neighbor {
    int64_t index = -1;
    double distance = 0.0;
};

class DistanceCalculator {
public:
    explicit DistanceCalculator(DistanceMetric metric = DistanceMetric::COSINE,
                                const DistanceWeights& weights = DistanceWeights());

    /**
     * Distance under the current metric.
     * @throws DimensionMismatch if the lengths differ
     */
    double calculate_distance(const std::vector<float>& a, const std::vector<float>& b) const;

    template <typename Field, size_t N>
    double calculate_distance(const FeatureVector<Field, N>& a, const FeatureVector<Field, N>& b) const {
        return distance(a.data(), b.data(), N);
    }

    std::vector<double> calculate_batch_distances(const std::vector<float>& query,
                                                  const std::vector<std::vector<float>>& targets) const;

    MultiTierDistance calculate_multi_tier_distance(const CompositeDNA& a, const CompositeDNA& b) const;

    /**
     * Mean distance over the first min(len a, len b) strokes, paired by
     * index. 1.0 if either sequence is empty.
     */
    double calculate_stroke_distance(const std::vector<StrokeDNA>& a, const std::vector<StrokeDNA>& b) const;

    /** {-1, +inf} if there are no candidates */
    Neighbor find_nearest_neighbor(const std::vector<float>& query,
                                   const std::vector<std::vector<float>>& candidates) const;

    /** The k closest candidates, ties kept in candidate order */
    std::vector<Neighbor> find_k_nearest_neighbors(const std::vector<float>& query,
                                                   const std::vector<std::vector<float>>& candidates,
                                                   size_t k) const;

    void set_metric(DistanceMetric metric) { metric_ = metric; }
    DistanceMetric get_metric() const { return metric_; }
    const DistanceWeights& get_weights() const { return weights_; }

private:
    double distance(const float* a, const float* b, size_t n) const;

    DistanceMetric metric_;
    DistanceWeights weights_;
};

double EuclideanDistance(const float* a, const float* b, size_t n);
double CosineDistance(const float* a, const float* b, size_t n);
double ManhattanDistance(const float* a, const float* b, size_t n);

} // namespace art_dna

#endif // ARTDNA_DISTANCE_CALCULATOR_H
