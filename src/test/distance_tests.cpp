// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Unit tests for DistanceCalculator
 *
 * Metric identities and symmetry, dimension checks, multi-tier
 * weighting and nearest-neighbour search.
 */

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/distance_calculator.h>
#include <art_dna/dna_errors.h>

#include <cmath>
#include <limits>

using namespace art_dna;

namespace {

const DistanceMetric ALL_METRICS[] = {DistanceMetric::EUCLIDEAN, DistanceMetric::COSINE, DistanceMetric::MANHATTAN};

StrokeDNA MakeStrokeDNA(float fill) {
    StrokeDNA dna;
    dna.dna_id = "stroke_x";
    for (size_t i = 0; i < STROKE_DIMENSIONS; i++) dna.features[i] = fill + 0.01f * i;
    return dna;
}

} // namespace

BOOST_AUTO_TEST_SUITE(distance_tests)

BOOST_AUTO_TEST_CASE(self_distance_is_zero) {
    std::vector<float> a{1.0f, -2.0f, 3.5f, 0.25f};
    BOOST_CHECK_EQUAL(DistanceCalculator(DistanceMetric::EUCLIDEAN).calculate_distance(a, a), 0.0);
    BOOST_CHECK_EQUAL(DistanceCalculator(DistanceMetric::MANHATTAN).calculate_distance(a, a), 0.0);
    BOOST_CHECK_SMALL(DistanceCalculator(DistanceMetric::COSINE).calculate_distance(a, a), 1e-9);
}

BOOST_AUTO_TEST_CASE(distance_is_symmetric) {
    std::vector<float> a{0.3f, 1.7f, -0.4f, 2.2f, 0.0f};
    std::vector<float> b{1.1f, -0.6f, 0.9f, 0.0f, 5.0f};
    for (DistanceMetric metric : ALL_METRICS) {
        DistanceCalculator calc(metric);
        BOOST_CHECK_CLOSE(calc.calculate_distance(a, b), calc.calculate_distance(b, a), 1e-9);
    }
}

BOOST_AUTO_TEST_CASE(known_values) {
    std::vector<float> a{0.0f, 0.0f};
    std::vector<float> b{3.0f, 4.0f};
    BOOST_CHECK_CLOSE(DistanceCalculator(DistanceMetric::EUCLIDEAN).calculate_distance(a, b), 5.0, 1e-9);
    BOOST_CHECK_CLOSE(DistanceCalculator(DistanceMetric::MANHATTAN).calculate_distance(a, b), 7.0, 1e-9);

    std::vector<float> x{1.0f, 0.0f};
    std::vector<float> y{0.0f, 1.0f};
    std::vector<float> neg{-1.0f, 0.0f};
    DistanceCalculator cosine(DistanceMetric::COSINE);
    BOOST_CHECK_CLOSE(cosine.calculate_distance(x, y), 1.0, 1e-9);
    BOOST_CHECK_CLOSE(cosine.calculate_distance(x, neg), 2.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(cosine_of_zero_vector_is_one) {
    DistanceCalculator cosine(DistanceMetric::COSINE);
    std::vector<float> zero(4, 0.0f);
    std::vector<float> other{1.0f, 2.0f, 3.0f, 4.0f};
    BOOST_CHECK_EQUAL(cosine.calculate_distance(zero, other), 1.0);
    BOOST_CHECK_EQUAL(cosine.calculate_distance(other, zero), 1.0);
    BOOST_CHECK_EQUAL(cosine.calculate_distance(zero, zero), 1.0);
}

BOOST_AUTO_TEST_CASE(unequal_lengths_are_rejected) {
    DistanceCalculator calc;
    std::vector<float> a(3, 1.0f);
    std::vector<float> b(4, 1.0f);
    BOOST_CHECK_THROW(calc.calculate_distance(a, b), DimensionMismatch);
    BOOST_CHECK_THROW(calc.calculate_batch_distances(a, {a, b}), DimensionMismatch);
}

BOOST_AUTO_TEST_CASE(typed_vectors_match_flat_vectors) {
    StrokeDNA a = MakeStrokeDNA(0.1f);
    StrokeDNA b = MakeStrokeDNA(0.7f);
    DistanceCalculator calc(DistanceMetric::EUCLIDEAN);
    BOOST_CHECK_CLOSE(calc.calculate_distance(a.features, b.features),
                      calc.calculate_distance(a.features.to_vector(), b.features.to_vector()), 1e-9);
}

BOOST_AUTO_TEST_CASE(batch_preserves_order) {
    DistanceCalculator calc(DistanceMetric::MANHATTAN);
    std::vector<float> q{0.0f, 0.0f};
    std::vector<double> d = calc.calculate_batch_distances(q, {{1.0f, 0.0f}, {0.0f, 0.0f}, {2.0f, 2.0f}});
    BOOST_REQUIRE_EQUAL(d.size(), 3u);
    BOOST_CHECK_EQUAL(d[0], 1.0);
    BOOST_CHECK_EQUAL(d[1], 0.0);
    BOOST_CHECK_EQUAL(d[2], 4.0);
}

BOOST_AUTO_TEST_CASE(stroke_sequence_distance) {
    DistanceCalculator calc(DistanceMetric::EUCLIDEAN);
    std::vector<StrokeDNA> a{MakeStrokeDNA(0.0f), MakeStrokeDNA(1.0f), MakeStrokeDNA(5.0f)};
    std::vector<StrokeDNA> b{MakeStrokeDNA(0.0f), MakeStrokeDNA(1.0f)};

    // Truncated to the shorter list, index aligned
    BOOST_CHECK_SMALL(calc.calculate_stroke_distance(a, b), 1e-9);
    BOOST_CHECK_EQUAL(calc.calculate_stroke_distance(a, {}), 1.0);
    BOOST_CHECK_EQUAL(calc.calculate_stroke_distance({}, {}), 1.0);
}

BOOST_AUTO_TEST_CASE(multi_tier_weights) {
    DistanceCalculator calc(DistanceMetric::EUCLIDEAN);
    CompositeDNA a;
    CompositeDNA b;
    a.stroke_dna.push_back(MakeStrokeDNA(0.5f));
    b.stroke_dna.push_back(MakeStrokeDNA(0.5f));

    // Missing image and temporal tiers count as maximally distant
    MultiTierDistance d = calc.calculate_multi_tier_distance(a, b);
    BOOST_CHECK_SMALL(d.stroke_distance, 1e-9);
    BOOST_CHECK_EQUAL(d.image_distance, 1.0);
    BOOST_CHECK_EQUAL(d.temporal_distance, 1.0);
    BOOST_CHECK_CLOSE(d.overall_distance, 0.3 + 0.2, 1e-9);
    BOOST_CHECK_CLOSE(d.weights.aesthetic, 0.1, 1e-9);

    a.temporal_dna = TemporalDNA();
    b.temporal_dna = TemporalDNA();
    d = calc.calculate_multi_tier_distance(a, b);
    BOOST_CHECK_SMALL(d.temporal_distance, 1e-9);
    BOOST_CHECK_CLOSE(d.overall_distance, 0.3, 1e-9);
}

BOOST_AUTO_TEST_CASE(composite_from_session_takes_latest_records) {
    DNASession session;
    session.add_stroke(MakeStrokeDNA(0.1f));
    ImageDNA first, second;
    first.dna_id = "image_1";
    second.dna_id = "image_2";
    session.image_dna = {first, second};

    CompositeDNA composite = CompositeDNA::FromSession(session);
    BOOST_CHECK_EQUAL(composite.stroke_dna.size(), 1u);
    BOOST_REQUIRE(composite.image_dna);
    BOOST_CHECK_EQUAL(composite.image_dna->dna_id, "image_2");
    BOOST_CHECK(!composite.temporal_dna);
}

BOOST_AUTO_TEST_CASE(nearest_neighbours) {
    DistanceCalculator calc(DistanceMetric::EUCLIDEAN);
    std::vector<float> q{0.0f, 0.0f};
    std::vector<std::vector<float>> candidates{{3.0f, 0.0f}, {1.0f, 0.0f}, {2.0f, 0.0f}, {1.0f, 0.0f}};

    Neighbor nearest = calc.find_nearest_neighbor(q, candidates);
    BOOST_CHECK_EQUAL(nearest.index, 1);
    BOOST_CHECK_EQUAL(nearest.distance, 1.0);

    std::vector<Neighbor> top = calc.find_k_nearest_neighbors(q, candidates, 3);
    BOOST_REQUIRE_EQUAL(top.size(), 3u);
    BOOST_CHECK_EQUAL(top[0].index, 1);
    BOOST_CHECK_EQUAL(top[1].index, 3);
    BOOST_CHECK_EQUAL(top[2].index, 2);

    BOOST_CHECK_EQUAL(calc.find_k_nearest_neighbors(q, candidates, 10).size(), 4u);

    Neighbor none = calc.find_nearest_neighbor(q, {});
    BOOST_CHECK_EQUAL(none.index, -1);
    BOOST_CHECK(std::isinf(none.distance));
}

BOOST_AUTO_TEST_CASE(metric_can_be_switched) {
    DistanceCalculator calc;
    BOOST_CHECK(calc.get_metric() == DistanceMetric::COSINE);
    calc.set_metric(DistanceMetric::MANHATTAN);
    BOOST_CHECK_EQUAL(calc.calculate_distance(std::vector<float>{1.0f}, std::vector<float>{3.0f}), 2.0);
}

BOOST_AUTO_TEST_SUITE_END()
