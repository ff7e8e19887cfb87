// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/projector.h>

#include <art_dna/distance_calculator.h>
#include <art_dna/seeded_rng.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace art_dna {

namespace {

struct Edge {
    size_t index;
    double weight;
};

using Embedding = std::vector<std::array<double, 3>>;

std::vector<std::vector<Edge>> BuildNeighborGraph(const std::vector<std::vector<double>>& distances, size_t k) {
    size_t n = distances.size();
    std::vector<std::vector<Edge>> graph(n);

    for (size_t i = 0; i < n; i++) {
        std::vector<std::pair<size_t, double>> others;
        others.reserve(n - 1);
        for (size_t j = 0; j < n; j++) {
            if (j != i) others.emplace_back(j, distances[i][j]);
        }
        std::stable_sort(others.begin(), others.end(),
                         [](const std::pair<size_t, double>& a, const std::pair<size_t, double>& b) {
                             return a.second < b.second;
                         });
        if (others.size() > k) others.resize(k);

        for (const auto& other : others) {
            graph[i].push_back({other.first, std::exp(-other.second)});
        }
    }
    return graph;
}

bool IsNeighbor(const std::vector<Edge>& edges, size_t j) {
    for (const Edge& e : edges) {
        if (e.index == j) return true;
    }
    return false;
}

double Separation(const std::array<double, 3>& a, const std::array<double, 3>& b, std::array<double, 3>& delta) {
    for (size_t d = 0; d < 3; d++) delta[d] = b[d] - a[d];
    return std::sqrt(delta[0] * delta[0] + delta[1] * delta[1] + delta[2] * delta[2]);
}

} // namespace

ProjectorParams ProjectorParams::FromConfig(const DNAConfig& config) {
    ProjectorParams params;
    params.n_neighbors = config.umap_n_neighbors;
    params.min_dist = config.umap_min_dist;
    params.n_components = config.umap_n_components;
    params.metric = config.umap_metric;
    params.seed = config.projector_seed;
    return params;
}

Projector::Projector(const ProjectorParams& params)
    : params_(params) {}

RecommendedParams Projector::get_recommended_params(size_t dataset_size) {
    if (dataset_size < 50) return {5, 0.1};
    if (dataset_size < 200) return {15, 0.1};
    if (dataset_size < 1000) return {30, 0.05};
    return {50, 0.01};
}

std::vector<Point3D> Projector::project(const std::vector<std::vector<float>>& features) const {
    std::vector<Point3D> result;
    if (features.empty()) return result;

    size_t n = features.size();
    size_t axes = std::min<size_t>(std::max<size_t>(params_.n_components, 1), 3);
    DistanceCalculator calculator(params_.metric);

    std::vector<std::vector<double>> distances(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) {
            if (i != j) distances[i][j] = calculator.calculate_distance(features[i], features[j]);
        }
    }

    std::vector<std::vector<Edge>> graph = BuildNeighborGraph(distances, params_.n_neighbors);

    SeededRNG rng(params_.seed);
    Embedding embedding(n);
    for (auto& point : embedding) {
        for (size_t d = 0; d < 3; d++) {
            double value = (rng.next() - 0.5) * 10.0;
            point[d] = d < axes ? value : 0.0;
        }
    }

    const double repel_below = params_.min_dist * 5.0;
    std::array<double, 3> delta;

    for (size_t iter = 0; iter < params_.iterations; iter++) {
        Embedding gradients(n, std::array<double, 3>{{0.0, 0.0, 0.0}});

        // Attraction toward graph neighbours
        for (size_t i = 0; i < n; i++) {
            for (const Edge& edge : graph[i]) {
                double dist = Separation(embedding[i], embedding[edge.index], delta);
                if (dist <= 0.0) continue;
                double force = edge.weight * (dist - params_.min_dist);
                for (size_t d = 0; d < axes; d++) gradients[i][d] += force * delta[d] / dist;
            }
        }

        // Repulsion between close non-neighbours
        for (size_t i = 0; i < n; i++) {
            for (size_t j = i + 1; j < n; j++) {
                if (IsNeighbor(graph[i], j)) continue;
                double dist = Separation(embedding[i], embedding[j], delta);
                if (dist <= 0.0 || dist >= repel_below) continue;
                double force = -0.1 / (dist + 0.1);
                for (size_t d = 0; d < axes; d++) {
                    gradients[i][d] += force * delta[d] / dist;
                    gradients[j][d] -= force * delta[d] / dist;
                }
            }
        }

        for (size_t i = 0; i < n; i++) {
            for (size_t d = 0; d < axes; d++) embedding[i][d] += gradients[i][d] * params_.learning_rate;
        }
    }

    result.reserve(n);
    for (const auto& point : embedding) {
        result.push_back({point[0], point[1], point[2]});
    }
    return result;
}

template <typename DNA>
Projection Projector::project_records(const std::vector<DNA>& dnas) const {
    double start = GetSteadyMillis();

    std::vector<std::vector<float>> features;
    features.reserve(dnas.size());
    Projection projection;
    for (const DNA& dna : dnas) {
        features.push_back(dna.features.to_vector());
        projection.source_dnas.push_back(dna.dna_id);
    }

    projection.projection_id = GenerateDNAId("projection");
    projection.coordinates = project(features);
    projection.n_neighbors = params_.n_neighbors;
    projection.min_dist = params_.min_dist;
    projection.metric = DistanceMetricName(params_.metric);
    projection.computed_at = GetTimeMillis();
    projection.computation_time_ms = std::max(0.0, GetSteadyMillis() - start);

    LogPrintAnalysis(DEBUG, "Projected %zu vectors in %.2fms (k=%zu, min_dist=%.3f)",
                     dnas.size(), projection.computation_time_ms, params_.n_neighbors, params_.min_dist);
    return projection;
}

Projection Projector::project_strokes(const std::vector<StrokeDNA>& dnas) const {
    return project_records(dnas);
}

Projection Projector::project_images(const std::vector<ImageDNA>& dnas) const {
    return project_records(dnas);
}

Projection Projector::project_temporals(const std::vector<TemporalDNA>& dnas) const {
    return project_records(dnas);
}

} // namespace art_dna
