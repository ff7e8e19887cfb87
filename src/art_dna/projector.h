// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_PROJECTOR_H
#define ARTDNA_PROJECTOR_H

/**
 * Low-dimensional projection of a batch of same-tier DNA vectors, for
 * visualization.
 *
 * A simplified neighbour-graph embedding:
 *   1. all-pairs distance matrix (DistanceCalculator, configured metric)
 *   2. k-nearest-neighbour graph with exp(-d) edge weights
 *   3. embedding initialized uniformly in (-5, 5) per axis from a SeededRNG
 *   4. fixed-step gradient refinement: neighbours are pulled toward a
 *      separation of min_dist, close non-neighbours are pushed apart
 *
 * Identical seed and input give identical coordinates.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

#include <cstdint>
#include <string>
#include <vector>

namespace art_dna {

struct Point3D {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Projection {
    std::string projection_id;
    std::vector<std::string> source_dnas;
    std::vector<Point3D> coordinates;
    size_t n_neighbors = 0;
    double min_dist = 0.0;
    std::string metric;
    int64_t computed_at = 0;
    double computation_time_ms = 0.0;
};

struct ProjectorParams {
    size_t n_neighbors = 15;
    double min_dist = 0.1;
    size_t n_components = 3;    // axes past this stay at 0
    DistanceMetric metric = DistanceMetric::COSINE;
    uint32_t seed = 42;
    size_t iterations = 100;
    double learning_rate = 0.1;

    static ProjectorParams FromConfig(const DNAConfig& config);
};

struct RecommendedParams {
    size_t n_neighbors;
    double min_dist;
};

class Projector {
public:
    explicit Projector(const ProjectorParams& params = ProjectorParams());

    Projection project_strokes(const std::vector<StrokeDNA>& dnas) const;
    Projection project_images(const std::vector<ImageDNA>& dnas) const;
    Projection project_temporals(const std::vector<TemporalDNA>& dnas) const;

    /**
     * Embed raw vectors. Empty input gives an empty result.
     * @throws DimensionMismatch if the vectors differ in length
     */
    std::vector<Point3D> project(const std::vector<std::vector<float>>& features) const;

    /** Neighbour count and separation suited to a corpus of the given size */
    static RecommendedParams get_recommended_params(size_t dataset_size);

    const ProjectorParams& get_params() const { return params_; }

private:
    template <typename DNA>
    Projection project_records(const std::vector<DNA>& dnas) const;

    ProjectorParams params_;
};

} // namespace art_dna

#endif // ARTDNA_PROJECTOR_H
