// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Main test entry point for the ArtDNA test suite
 *
 * Every *_tests.cpp file in this directory is linked into the same
 * executable and registers its own suite.
 */

#define BOOST_TEST_MODULE ArtDNA Test Suite
#include <boost/test/included/unit_test.hpp>

#include <art_dna/dna_config.h>
#include <util/config.h>
#include <util/config_validator.h>
#include <util/logging.h>

#include <iostream>

/**
 * Global test suite setup
 */
struct ArtDNATestSetup {
    ArtDNATestSetup() {
        std::cout << "ArtDNA Test Suite Starting..." << std::endl;
        std::cout << "Using Boost.Test version "
                  << BOOST_VERSION / 100000 << "."
                  << BOOST_VERSION / 100 % 1000 << "."
                  << BOOST_VERSION % 100 << std::endl;

        // Expected failures are logged at WARN/ERROR; keep the test output readable
        CLoggingConfig::GetInstance().SetConsoleLogging(false);
    }

    ~ArtDNATestSetup() {
        std::cout << "ArtDNA Test Suite Complete" << std::endl;
    }
};

BOOST_GLOBAL_FIXTURE(ArtDNATestSetup);

BOOST_AUTO_TEST_SUITE(sanity_tests)

BOOST_AUTO_TEST_CASE(default_config_is_valid) {
    CConfigParser parser;
    for (const ConfigValidationResult& result : CConfigValidator::ValidateAll(parser)) {
        BOOST_CHECK_MESSAGE(result.valid, result.field_name + ": " + result.error_message);
    }

    art_dna::DNAConfig config = art_dna::LoadDNAConfig(parser);
    BOOST_CHECK_EQUAL(config.stroke_dimensions, 30u);
    BOOST_CHECK_EQUAL(config.image_dimensions, 512u);
    BOOST_CHECK_EQUAL(config.temporal_dimensions, 32u);
    BOOST_CHECK_EQUAL(config.worker_pool_size, 2u);
    BOOST_CHECK(config.storage_mode == art_dna::StorageMode::LEVELDB);
}

BOOST_AUTO_TEST_SUITE_END()
