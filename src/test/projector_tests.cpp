// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/dna_errors.h>
#include <art_dna/projector.h>
#include <art_dna/seeded_rng.h>

#include <cmath>

using namespace art_dna;

namespace {

std::vector<StrokeDNA> MakeClusters(size_t per_cluster) {
    SeededRNG rng(7);
    std::vector<StrokeDNA> dnas;
    for (size_t cluster = 0; cluster < 2; cluster++) {
        for (size_t i = 0; i < per_cluster; i++) {
            StrokeDNA dna;
            dna.dna_id = "stroke_" + std::to_string(cluster) + "_" + std::to_string(i);
            for (size_t d = 0; d < STROKE_DIMENSIONS; d++) {
                double centre = (cluster == 0) == (d % 2 == 0) ? 1.0 : 0.0;
                dna.features[d] = static_cast<float>(centre + rng.next_float(-0.05, 0.05));
            }
            dnas.push_back(dna);
        }
    }
    return dnas;
}

} // namespace

BOOST_AUTO_TEST_SUITE(projector_tests)

BOOST_AUTO_TEST_CASE(projection_is_deterministic) {
    std::vector<StrokeDNA> dnas = MakeClusters(6);
    Projector projector;

    Projection a = projector.project_strokes(dnas);
    Projection b = projector.project_strokes(dnas);

    BOOST_REQUIRE_EQUAL(a.coordinates.size(), dnas.size());
    BOOST_REQUIRE_EQUAL(b.coordinates.size(), dnas.size());
    for (size_t i = 0; i < dnas.size(); i++) {
        BOOST_CHECK_EQUAL(a.coordinates[i].x, b.coordinates[i].x);
        BOOST_CHECK_EQUAL(a.coordinates[i].y, b.coordinates[i].y);
        BOOST_CHECK_EQUAL(a.coordinates[i].z, b.coordinates[i].z);
        BOOST_CHECK(std::isfinite(a.coordinates[i].x));
    }
    BOOST_CHECK(a.projection_id != b.projection_id);
}

BOOST_AUTO_TEST_CASE(projection_metadata) {
    std::vector<StrokeDNA> dnas = MakeClusters(3);
    ProjectorParams params;
    params.n_neighbors = 4;
    params.min_dist = 0.2;
    params.metric = DistanceMetric::EUCLIDEAN;
    Projector projector(params);

    Projection p = projector.project_strokes(dnas);
    BOOST_CHECK_EQUAL(p.n_neighbors, 4u);
    BOOST_CHECK_CLOSE(p.min_dist, 0.2, 1e-9);
    BOOST_CHECK_EQUAL(p.metric, "euclidean");
    BOOST_REQUIRE_EQUAL(p.source_dnas.size(), dnas.size());
    BOOST_CHECK_EQUAL(p.source_dnas[0], dnas[0].dna_id);
    BOOST_CHECK(p.computation_time_ms >= 0.0);
}

BOOST_AUTO_TEST_CASE(seed_changes_layout) {
    std::vector<StrokeDNA> dnas = MakeClusters(4);
    ProjectorParams p1;
    ProjectorParams p2;
    p2.seed = 1234;

    Projection a = Projector(p1).project_strokes(dnas);
    Projection b = Projector(p2).project_strokes(dnas);
    bool differs = false;
    for (size_t i = 0; i < dnas.size(); i++) {
        if (a.coordinates[i].x != b.coordinates[i].x) differs = true;
    }
    BOOST_CHECK(differs);
}

BOOST_AUTO_TEST_CASE(unused_axes_stay_zero) {
    ProjectorParams params;
    params.n_components = 2;
    Projection p = Projector(params).project_strokes(MakeClusters(4));
    for (const Point3D& point : p.coordinates) {
        BOOST_CHECK_EQUAL(point.z, 0.0);
    }
}

BOOST_AUTO_TEST_CASE(clusters_stay_apart) {
    std::vector<StrokeDNA> dnas = MakeClusters(6);
    ProjectorParams params;
    params.n_neighbors = 5;
    params.iterations = 200;
    Projection p = Projector(params).project_strokes(dnas);

    auto centroid = [&](size_t first) {
        Point3D c;
        for (size_t i = first; i < first + 6; i++) {
            c.x += p.coordinates[i].x / 6.0;
            c.y += p.coordinates[i].y / 6.0;
            c.z += p.coordinates[i].z / 6.0;
        }
        return c;
    };
    auto dist = [](const Point3D& a, const Point3D& b) {
        return std::sqrt((a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y) + (a.z - b.z) * (a.z - b.z));
    };

    Point3D c0 = centroid(0);
    Point3D c1 = centroid(6);
    double within = 0.0;
    for (size_t i = 0; i < 6; i++) within += dist(p.coordinates[i], c0) / 6.0;
    BOOST_CHECK(dist(c0, c1) > within);
}

BOOST_AUTO_TEST_CASE(empty_and_single_inputs) {
    Projector projector;
    BOOST_CHECK(projector.project(std::vector<std::vector<float>>()).empty());

    std::vector<std::vector<float>> one{{1.0f, 2.0f, 3.0f}};
    std::vector<Point3D> points = projector.project(one);
    BOOST_REQUIRE_EQUAL(points.size(), 1u);
    BOOST_CHECK(std::isfinite(points[0].x));

    std::vector<std::vector<float>> ragged{{1.0f, 2.0f}, {1.0f}};
    BOOST_CHECK_THROW(projector.project(ragged), DimensionMismatch);
}

BOOST_AUTO_TEST_CASE(recommended_params_by_size) {
    BOOST_CHECK_EQUAL(Projector::get_recommended_params(10).n_neighbors, 5u);
    BOOST_CHECK_EQUAL(Projector::get_recommended_params(100).n_neighbors, 15u);
    BOOST_CHECK_EQUAL(Projector::get_recommended_params(500).n_neighbors, 30u);
    BOOST_CHECK_CLOSE(Projector::get_recommended_params(500).min_dist, 0.05, 1e-9);
    BOOST_CHECK_EQUAL(Projector::get_recommended_params(5000).n_neighbors, 50u);
}

BOOST_AUTO_TEST_CASE(params_from_config) {
    DNAConfig config;
    config.umap_n_neighbors = 8;
    config.umap_metric = DistanceMetric::MANHATTAN;
    config.projector_seed = 99;
    ProjectorParams params = ProjectorParams::FromConfig(config);
    BOOST_CHECK_EQUAL(params.n_neighbors, 8u);
    BOOST_CHECK(params.metric == DistanceMetric::MANHATTAN);
    BOOST_CHECK_EQUAL(params.seed, 99u);
}

BOOST_AUTO_TEST_SUITE_END()
