// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/dna_config.h>

#include <util/config.h>
#include <util/config_validator.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <set>

namespace art_dna {

std::string DistanceMetricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::EUCLIDEAN: return "euclidean";
        case DistanceMetric::COSINE: return "cosine";
        case DistanceMetric::MANHATTAN: return "manhattan";
    }
    return "cosine";
}

std::optional<DistanceMetric> ParseDistanceMetric(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "euclidean") return DistanceMetric::EUCLIDEAN;
    if (lower == "cosine") return DistanceMetric::COSINE;
    if (lower == "manhattan") return DistanceMetric::MANHATTAN;
    return std::nullopt;
}

std::string StorageModeName(StorageMode mode) {
    switch (mode) {
        case StorageMode::LEVELDB: return "leveldb";
        case StorageMode::FLATFILE: return "flatfile";
        case StorageMode::MEMORY: return "memory";
    }
    return "memory";
}

std::optional<StorageMode> ParseStorageMode(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "leveldb") return StorageMode::LEVELDB;
    if (lower == "flatfile") return StorageMode::FLATFILE;
    if (lower == "memory") return StorageMode::MEMORY;
    return std::nullopt;
}

const AestheticModeConfig& DNAConfig::mode_config(AestheticMode mode) const {
    switch (mode) {
        case AestheticMode::STRICT: return strict;
        case AestheticMode::CREATIVE: return creative;
        case AestheticMode::BALANCED: break;
    }
    return balanced;
}

DNAConfig LoadDNAConfig(const CConfigParser& parser) {
    DNAConfig config;

    std::set<std::string> rejected;
    for (const ConfigValidationResult& result : CConfigValidator::ValidateAll(parser)) {
        if (!result.valid) {
            LogPrintConfig(WARN, "%s (keeping default)",
                           CErrorFormatter::FormatForLog(result.ToErrorMessage()).c_str());
            rejected.insert(result.field_name);
        }
    }

    auto usable = [&](const char* key) {
        return parser.HasKey(key) && rejected.count(key) == 0;
    };

    if (usable("hot_path_budget_ms")) config.hot_path_budget_ms = static_cast<double>(parser.GetInt64("hot_path_budget_ms"));
    if (usable("cold_path_timeout_ms")) config.cold_path_timeout_ms = parser.GetInt64("cold_path_timeout_ms");
    if (usable("worker_pool_size")) config.worker_pool_size = static_cast<size_t>(parser.GetInt64("worker_pool_size"));
    if (usable("reference_width")) config.reference_width = static_cast<int>(parser.GetInt64("reference_width"));
    if (usable("reference_height")) config.reference_height = static_cast<int>(parser.GetInt64("reference_height"));

    if (usable("min_strokes_for_confidence")) {
        config.min_strokes_for_confidence = static_cast<uint64_t>(parser.GetInt64("min_strokes_for_confidence"));
    }
    if (usable("max_strokes_for_confidence")) {
        config.max_strokes_for_confidence = static_cast<uint64_t>(parser.GetInt64("max_strokes_for_confidence"));
    }
    if (config.min_strokes_for_confidence >= config.max_strokes_for_confidence) {
        LogPrintConfig(WARN, "min_strokes_for_confidence (%llu) must be below max_strokes_for_confidence (%llu), using 50/200",
                       static_cast<unsigned long long>(config.min_strokes_for_confidence),
                       static_cast<unsigned long long>(config.max_strokes_for_confidence));
        config.min_strokes_for_confidence = 50;
        config.max_strokes_for_confidence = 200;
    }
    if (usable("session_decay_hours")) config.session_decay_hours = static_cast<double>(parser.GetInt64("session_decay_hours"));

    if (usable("pretty_score_threshold")) config.pretty_score_threshold = parser.GetDouble("pretty_score_threshold");
    if (usable("strict_threshold")) config.strict.threshold = parser.GetDouble("strict_threshold");
    if (usable("balanced_threshold")) config.balanced.threshold = parser.GetDouble("balanced_threshold");
    if (usable("creative_threshold")) config.creative.threshold = parser.GetDouble("creative_threshold");
    if (usable("strict_reject_below")) config.strict.reject_below = parser.GetBool("strict_reject_below", true);
    if (usable("aesthetic_mode")) {
        config.aesthetic_mode = ParseAestheticMode(parser.GetString("aesthetic_mode")).value_or(config.aesthetic_mode);
    }

    config.fatigue_window_minutes = parser.GetDouble("fatigue_window_minutes", config.fatigue_window_minutes);
    if (usable("learning_decay_rate")) config.learning_decay_rate = parser.GetDouble("learning_decay_rate");
    config.session_cooldown_minutes = parser.GetDouble("session_cooldown_minutes", config.session_cooldown_minutes);

    if (usable("umap_n_neighbors")) config.umap_n_neighbors = static_cast<size_t>(parser.GetInt64("umap_n_neighbors"));
    if (usable("umap_min_dist")) config.umap_min_dist = parser.GetDouble("umap_min_dist");
    if (usable("umap_n_components")) config.umap_n_components = static_cast<size_t>(parser.GetInt64("umap_n_components"));
    if (usable("umap_metric")) {
        config.umap_metric = ParseDistanceMetric(parser.GetString("umap_metric")).value_or(config.umap_metric);
    }

    if (usable("storage_mode")) {
        config.storage_mode = ParseStorageMode(parser.GetString("storage_mode")).value_or(config.storage_mode);
    }
    if (usable("storage_path")) config.storage_path = parser.GetString("storage_path");
    if (usable("archive_after_days")) config.archive_after_days = static_cast<int>(parser.GetInt64("archive_after_days"));
    if (usable("max_sessions_in_memory")) {
        config.max_sessions_in_memory = static_cast<size_t>(parser.GetInt64("max_sessions_in_memory"));
    }

    if (usable("weight_stroke")) config.weights.stroke = parser.GetDouble("weight_stroke");
    if (usable("weight_image")) config.weights.image = parser.GetDouble("weight_image");
    if (usable("weight_temporal")) config.weights.temporal = parser.GetDouble("weight_temporal");
    if (usable("weight_aesthetic")) config.weights.aesthetic = parser.GetDouble("weight_aesthetic");

    config.image_seed = static_cast<uint32_t>(parser.GetInt64("image_seed", config.image_seed));
    config.projector_seed = static_cast<uint32_t>(parser.GetInt64("projector_seed", config.projector_seed));

    LogPrintConfig(DEBUG, "DNA config: budget=%.1fms pool=%zu storage=%s metric=%s",
                   config.hot_path_budget_ms, config.worker_pool_size,
                   StorageModeName(config.storage_mode).c_str(),
                   DistanceMetricName(config.umap_metric).c_str());

    return config;
}

bool InitLogging(const CConfigParser& parser, const std::string& datadir) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();

    std::string level = parser.GetString("log_level", "");
    if (!level.empty()) {
        ConfigValidationResult result =
            CConfigValidator::ValidateChoice(level, "log_level", {"error", "warn", "warning", "info", "debug"});
        if (result.valid) {
            logging.SetLogLevel(ParseLogLevel(level));
        } else {
            LogPrintConfig(WARN, "%s", CErrorFormatter::FormatForLog(
                CErrorFormatter::ConfigError(result.field_name, result.error_message)).c_str());
        }
    }

    std::vector<std::string> categories = parser.GetList("debug");
    if (!categories.empty()) {
        uint32_t mask = 0;
        for (const std::string& name : categories) {
            LogCategory category;
            if (!ParseLogCategory(name, category)) {
                LogPrintConfig(WARN, "%s", CErrorFormatter::FormatForLog(
                    CErrorFormatter::ConfigError("debug", "unknown log category '" + name + "'")).c_str());
                continue;
            }
            mask |= static_cast<uint32_t>(category);
        }
        logging.DisableCategory(LogCategory::ALL);
        logging.EnableCategory(static_cast<LogCategory>(mask));
    }

    logging.SetConsoleLogging(parser.GetBool("log_console", logging.IsConsoleLoggingEnabled()));
    if (parser.HasKey("log_file")) logging.SetLogFile(parser.GetString("log_file"));

    int64_t max_size_mb = parser.GetInt64("log_max_size_mb", 0);
    if (max_size_mb > 0) logging.SetMaxLogSize(static_cast<size_t>(max_size_mb) * 1024 * 1024);
    int64_t max_files = parser.GetInt64("log_max_files", 0);
    if (max_files > 0) logging.SetMaxLogFiles(static_cast<size_t>(max_files));

    if (!CLogger::GetInstance().Initialize(datadir)) {
        return false;
    }
    LogPrintConfig(INFO, "Logging initialized (file: %s)",
                   logging.IsFileLoggingEnabled() ? logging.GetLogFile().c_str() :
                   datadir.empty() ? "none" : (datadir + "/artdna.log").c_str());
    return true;
}

} // namespace art_dna
