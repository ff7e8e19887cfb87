// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/distance_calculator.h>

#include <art_dna/dna_errors.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace art_dna {

double EuclideanDistance(const float* a, const float* b, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; i++) {
        double diff = static_cast<double>(a[i]) - b[i];
        sum += diff * diff;
    }
    return std::sqrt(sum);
}

double CosineDistance(const float* a, const float* b, size_t n) {
    double dot = 0.0, mag_a = 0.0, mag_b = 0.0;
    for (size_t i = 0; i < n; i++) {
        dot += static_cast<double>(a[i]) * b[i];
        mag_a += static_cast<double>(a[i]) * a[i];
        mag_b += static_cast<double>(b[i]) * b[i];
    }
    double magnitude = std::sqrt(mag_a) * std::sqrt(mag_b);
    if (magnitude == 0.0) return 1.0;
    return 1.0 - dot / magnitude;
}

double ManhattanDistance(const float* a, const float* b, size_t n) {
    double sum = 0.0;
    for (size_t i = 0; i < n; i++) {
        sum += std::fabs(static_cast<double>(a[i]) - b[i]);
    }
    return sum;
}

CompositeDNA CompositeDNA::FromSession(const DNASession& session) {
    CompositeDNA composite;
    composite.stroke_dna = session.stroke_dna;
    if (const ImageDNA* image = session.latest_image()) composite.image_dna = *image;
    if (const TemporalDNA* temporal = session.latest_temporal()) composite.temporal_dna = *temporal;
    return composite;
}

DistanceCalculator::DistanceCalculator(DistanceMetric metric, const DistanceWeights& weights)
    : metric_(metric), weights_(weights) {}

double DistanceCalculator::distance(const float* a, const float* b, size_t n) const {
    switch (metric_) {
        case DistanceMetric::EUCLIDEAN: return EuclideanDistance(a, b, n);
        case DistanceMetric::MANHATTAN: return ManhattanDistance(a, b, n);
        case DistanceMetric::COSINE: break;
    }
    return CosineDistance(a, b, n);
}

double DistanceCalculator::calculate_distance(const std::vector<float>& a, const std::vector<float>& b) const {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }
    return distance(a.data(), b.data(), a.size());
}

std::vector<double> DistanceCalculator::calculate_batch_distances(const std::vector<float>& query,
                                                                  const std::vector<std::vector<float>>& targets) const {
    std::vector<double> result;
    result.reserve(targets.size());
    for (const auto& target : targets) {
        result.push_back(calculate_distance(query, target));
    }
    return result;
}

double DistanceCalculator::calculate_stroke_distance(const std::vector<StrokeDNA>& a,
                                                     const std::vector<StrokeDNA>& b) const {
    if (a.empty() || b.empty()) return 1.0;

    size_t pairs = std::min(a.size(), b.size());
    double total = 0.0;
    for (size_t i = 0; i < pairs; i++) {
        total += calculate_distance(a[i].features, b[i].features);
    }
    return total / static_cast<double>(pairs);
}

MultiTierDistance DistanceCalculator::calculate_multi_tier_distance(const CompositeDNA& a,
                                                                    const CompositeDNA& b) const {
    MultiTierDistance result;
    result.weights = weights_;
    result.stroke_distance = calculate_stroke_distance(a.stroke_dna, b.stroke_dna);
    result.image_distance = (a.image_dna && b.image_dna)
        ? calculate_distance(a.image_dna->features, b.image_dna->features)
        : 1.0;
    result.temporal_distance = (a.temporal_dna && b.temporal_dna)
        ? calculate_distance(a.temporal_dna->features, b.temporal_dna->features)
        : 1.0;

    // The aesthetic weight is carried in the result but has no tier distance to scale
    result.overall_distance = result.stroke_distance * weights_.stroke +
                              result.image_distance * weights_.image +
                              result.temporal_distance * weights_.temporal;
    return result;
}

Neighbor DistanceCalculator::find_nearest_neighbor(const std::vector<float>& query,
                                                   const std::vector<std::vector<float>>& candidates) const {
    Neighbor best{-1, std::numeric_limits<double>::infinity()};
    for (size_t i = 0; i < candidates.size(); i++) {
        double d = calculate_distance(query, candidates[i]);
        if (d < best.distance) {
            best.index = static_cast<int64_t>(i);
            best.distance = d;
        }
    }
    return best;
}

std::vector<Neighbor> DistanceCalculator::find_k_nearest_neighbors(const std::vector<float>& query,
                                                                   const std::vector<std::vector<float>>& candidates,
                                                                   size_t k) const {
    std::vector<Neighbor> all;
    all.reserve(candidates.size());
    for (size_t i = 0; i < candidates.size(); i++) {
        all.push_back({static_cast<int64_t>(i), calculate_distance(query, candidates[i])});
    }
    std::stable_sort(all.begin(), all.end(), [](const Neighbor& x, const Neighbor& y) {
        return x.distance < y.distance;
    });
    if (all.size() > k) all.resize(k);
    return all;
}

} // namespace art_dna
