// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/dna_errors.h>
#include <art_dna/seeded_rng.h>

#include <algorithm>
#include <vector>

using namespace art_dna;

BOOST_AUTO_TEST_SUITE(seeded_rng_tests)

BOOST_AUTO_TEST_CASE(same_seed_same_sequence) {
    SeededRNG a(42);
    SeededRNG b(42);
    for (int i = 0; i < 5; i++) {
        double va = a.next();
        BOOST_CHECK_EQUAL(va, b.next());
        BOOST_CHECK(va >= 0.0 && va < 1.0);
    }

    SeededRNG c(43);
    SeededRNG d(42);
    bool differs = false;
    for (int i = 0; i < 5; i++) {
        if (c.next() != d.next()) differs = true;
    }
    BOOST_CHECK(differs);
}

BOOST_AUTO_TEST_CASE(clone_advances_independently) {
    SeededRNG original(7);
    original.next();
    original.next();

    SeededRNG copy = original.clone();
    double expected = SeededRNG(original).next();

    copy.next();
    copy.next();
    copy.next();
    BOOST_CHECK_EQUAL(original.next(), expected);
}

BOOST_AUTO_TEST_CASE(reset_restarts_sequence) {
    SeededRNG rng(1234);
    std::vector<double> first;
    for (int i = 0; i < 4; i++) first.push_back(rng.next());

    rng.reset();
    for (int i = 0; i < 4; i++) BOOST_CHECK_EQUAL(rng.next(), first[i]);
    BOOST_CHECK_EQUAL(rng.get_seed(), 1234u);
}

BOOST_AUTO_TEST_CASE(state_can_be_saved_and_restored) {
    SeededRNG rng(99);
    rng.next();
    uint32_t state = rng.get_state();
    double next = rng.next();

    rng.set_state(state);
    BOOST_CHECK_EQUAL(rng.next(), next);
}

BOOST_AUTO_TEST_CASE(ranges_are_respected) {
    SeededRNG rng(5);
    for (int i = 0; i < 200; i++) {
        int64_t v = rng.next_int(-3, 3);
        BOOST_CHECK(v >= -3 && v <= 3);
        double f = rng.next_float(2.0, 4.0);
        BOOST_CHECK(f >= 2.0 && f < 4.0);
    }
    BOOST_CHECK_EQUAL(rng.next_int(9, 9), 9);
    BOOST_CHECK_THROW(rng.next_int(3, 2), InvalidInput);
    BOOST_CHECK(!rng.next_boolean(0.0));
}

BOOST_AUTO_TEST_CASE(gaussian_is_centred) {
    SeededRNG rng(42);
    double sum = 0.0;
    const int n = 2000;
    for (int i = 0; i < n; i++) sum += rng.next_gaussian(10.0, 2.0);
    BOOST_CHECK_CLOSE(sum / n, 10.0, 2.0);
}

BOOST_AUTO_TEST_CASE(shuffle_and_choice) {
    SeededRNG rng(42);
    std::vector<int> items{1, 2, 3, 4, 5, 6, 7, 8};

    std::vector<int> shuffled = rng.shuffle(items);
    std::vector<int> sorted = shuffled;
    std::sort(sorted.begin(), sorted.end());
    BOOST_CHECK(sorted == items);

    SeededRNG again(42);
    BOOST_CHECK(again.shuffle(items) == shuffled);

    int picked = rng.choice(items);
    BOOST_CHECK(std::find(items.begin(), items.end(), picked) != items.end());
    BOOST_CHECK_THROW(rng.choice(std::vector<int>()), InvalidInput);
}

BOOST_AUTO_TEST_CASE(derive_offsets_the_seed) {
    SeededRNG base(100);
    SeededRNG derived = base.derive(5);
    BOOST_CHECK_EQUAL(derived.get_seed(), 105u);

    SeededRNG direct(105);
    BOOST_CHECK_EQUAL(derived.next(), direct.next());
}

BOOST_AUTO_TEST_SUITE_END()
