// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <util/config_validator.h>
#include <util/config.h>
#include <util/strencodings.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

ErrorMessage ConfigValidationResult::ToErrorMessage() const {
    ErrorMessage error = CErrorFormatter::ConfigError(field_name, error_message);
    if (!suggestions.empty()) {
        error.recovery_steps = suggestions;
    }
    return error;
}

ConfigValidationResult CConfigValidator::ValidateIntRange(const std::string& value, const std::string& field_name,
                                                          int64_t min_value, int64_t max_value) {
    ConfigValidationResult result;
    result.field_name = field_name;

    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (parsed < min_value || parsed > max_value) {
            result.valid = false;
            result.error_message = "Value must be between " + std::to_string(min_value) +
                                   " and " + std::to_string(max_value);
            result.suggestions.push_back("Use an integer in [" + std::to_string(min_value) + ", " +
                                         std::to_string(max_value) + "]");
        }
    } catch (const std::exception&) {
        result.valid = false;
        result.error_message = "Invalid integer format";
        result.suggestions.push_back("Value must be a whole number");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateUnitInterval(const std::string& value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed)) {
            throw std::invalid_argument("not a finite number");
        }
        if (parsed < 0.0 || parsed > 1.0) {
            result.valid = false;
            result.error_message = "Value must be between 0.0 and 1.0";
            result.suggestions.push_back("Thresholds and weights are fractions, e.g. 0.7");
        }
    } catch (const std::exception&) {
        result.valid = false;
        result.error_message = "Invalid numeric format";
        result.suggestions.push_back("Use a decimal number such as 0.5");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateChoice(const std::string& value, const std::string& field_name,
                                                        const std::vector<std::string>& choices) {
    ConfigValidationResult result;
    result.field_name = field_name;

    std::string lower = ToLower(value);

    if (std::find(choices.begin(), choices.end(), lower) == choices.end()) {
        result.valid = false;
        result.error_message = "Unknown value '" + value + "'";
        std::string joined;
        for (const auto& choice : choices) {
            if (!joined.empty()) joined += ", ";
            joined += choice;
        }
        result.suggestions.push_back("Valid values: " + joined);
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateDataDir(const std::string& path) {
    ConfigValidationResult result;
    result.field_name = "storage_path";

    if (path.empty()) {
        return result;  // Empty uses the default
    }

    const std::string forbidden = "<>\"|?*";
    if (path.find_first_of(forbidden) != std::string::npos) {
        result.valid = false;
        result.error_message = "Path contains forbidden characters";
        result.suggestions.push_back("Remove forbidden characters: < > \" | ? *");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateBool(const std::string& value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    std::string lower = ToLower(value);

    if (lower != "0" && lower != "1" && lower != "true" && lower != "false" &&
        lower != "yes" && lower != "no" && lower != "on" && lower != "off") {
        result.valid = false;
        result.error_message = "Invalid boolean value";
        result.suggestions.push_back("Use: 0/1, true/false, yes/no, or on/off");
    }

    return result;
}

std::vector<ConfigValidationResult> CConfigValidator::ValidateAll(const CConfigParser& config) {
    std::vector<ConfigValidationResult> results;

    struct IntKey { const char* name; int64_t min_value; int64_t max_value; };
    static const IntKey int_keys[] = {
        {"hot_path_budget_ms", 1, 10000},
        {"cold_path_timeout_ms", 1, 3600000},
        {"worker_pool_size", 1, 64},
        {"reference_width", 1, 65536},
        {"reference_height", 1, 65536},
        {"min_strokes_for_confidence", 0, 1000000},
        {"max_strokes_for_confidence", 1, 1000000},
        {"session_decay_hours", 1, 100000},
        {"umap_n_neighbors", 2, 1000},
        {"umap_n_components", 1, 3},
        {"archive_after_days", 1, 36500},
        {"max_sessions_in_memory", 1, 1000000},
    };
    for (const auto& key : int_keys) {
        std::string value = config.GetString(key.name, "");
        if (!value.empty()) {
            results.push_back(ValidateIntRange(value, key.name, key.min_value, key.max_value));
        }
    }

    static const char* unit_keys[] = {
        "pretty_score_threshold", "strict_threshold", "balanced_threshold", "creative_threshold",
        "umap_min_dist", "learning_decay_rate",
        "weight_stroke", "weight_image", "weight_temporal", "weight_aesthetic",
    };
    for (const char* key : unit_keys) {
        std::string value = config.GetString(key, "");
        if (!value.empty()) {
            results.push_back(ValidateUnitInterval(value, key));
        }
    }

    std::string mode = config.GetString("storage_mode", "");
    if (!mode.empty()) {
        results.push_back(ValidateChoice(mode, "storage_mode", {"leveldb", "flatfile", "memory"}));
    }

    std::string metric = config.GetString("umap_metric", "");
    if (!metric.empty()) {
        results.push_back(ValidateChoice(metric, "umap_metric", {"euclidean", "cosine", "manhattan"}));
    }

    std::string aesthetic_mode = config.GetString("aesthetic_mode", "");
    if (!aesthetic_mode.empty()) {
        results.push_back(ValidateChoice(aesthetic_mode, "aesthetic_mode", {"strict", "balanced", "creative"}));
    }

    std::string path = config.GetString("storage_path", "");
    if (!path.empty()) {
        results.push_back(ValidateDataDir(path));
    }

    std::string reject = config.GetString("strict_reject_below", "");
    if (!reject.empty()) {
        results.push_back(ValidateBool(reject, "strict_reject_below"));
    }

    return results;
}
