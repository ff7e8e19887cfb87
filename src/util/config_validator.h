// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Configuration Validation
 *
 * Validates engine configuration values and provides helpful error messages
 */

#ifndef ARTDNA_UTIL_CONFIG_VALIDATOR_H
#define ARTDNA_UTIL_CONFIG_VALIDATOR_H

#include <string>
#include <vector>
#include <cstdint>
#include <util/error_format.h>

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool valid;
    std::string error_message;
    std::string field_name;
    std::vector<std::string> suggestions;

    ConfigValidationResult() : valid(true) {}
    ConfigValidationResult(const std::string& field, const std::string& error)
        : valid(false), error_message(error), field_name(field) {}

    /** Structured form for logging */
    ErrorMessage ToErrorMessage() const;
};

/**
 * Configuration validator
 */
class CConfigValidator {
public:
    /**
     * Validate an integer that must lie in [min_value, max_value]
     */
    static ConfigValidationResult ValidateIntRange(const std::string& value, const std::string& field_name,
                                                   int64_t min_value, int64_t max_value);

    /**
     * Validate a real number in [0, 1] (thresholds, weights, rates)
     */
    static ConfigValidationResult ValidateUnitInterval(const std::string& value, const std::string& field_name);

    /**
     * Validate a value against a fixed set of choices (case-insensitive)
     */
    static ConfigValidationResult ValidateChoice(const std::string& value, const std::string& field_name,
                                                 const std::vector<std::string>& choices);

    /**
     * Validate storage directory path
     */
    static ConfigValidationResult ValidateDataDir(const std::string& path);

    static ConfigValidationResult ValidateBool(const std::string& value, const std::string& field_name);

    /**
     * Validate all known configuration values that are present
     */
    static std::vector<ConfigValidationResult> ValidateAll(const class CConfigParser& config);
};

#endif // ARTDNA_UTIL_CONFIG_VALIDATOR_H
