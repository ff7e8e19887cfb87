// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_CONFIG_H
#define ARTDNA_DNA_CONFIG_H

/**
 * Engine configuration.
 *
 * DNAConfig is built once (defaults, or LoadDNAConfig from artdna.conf
 * plus ARTDNA_* environment overrides) and handed by const reference to
 * every component. Nothing reads configuration after construction.
 */

#include <art_dna/dna_types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

class CConfigParser;

namespace art_dna {

enum class DistanceMetric : uint8_t {
    EUCLIDEAN = 0,
    COSINE = 1,
    MANHATTAN = 2
};

std::string DistanceMetricName(DistanceMetric metric);
std::optional<DistanceMetric> ParseDistanceMetric(const std::string& name);

enum class StorageMode : uint8_t {
    LEVELDB = 0,    // durable, indexed, transactional
    FLATFILE = 1,   // flat synchronous key-value file
    MEMORY = 2      // volatile, for tests
};

std::string StorageModeName(StorageMode mode);
std::optional<StorageMode> ParseStorageMode(const std::string& name);

struct AestheticModeConfig {
    double threshold = 0.7;
    bool reject_below = false;  // advisory to callers; the regulator only reports
};

/** Per-tier weights for multi-tier distance */
struct DistanceWeights {
    double stroke = 0.4;
    double image = 0.3;
    double temporal = 0.2;
    double aesthetic = 0.1;     // carried, not folded into the sum
};

struct DNAConfig {
    // Dimensions (fixed by the vector types, exposed for reporting)
    size_t stroke_dimensions = STROKE_DIMENSIONS;
    size_t image_dimensions = IMAGE_DIMENSIONS;
    size_t temporal_dimensions = TEMPORAL_DIMENSIONS;

    // Performance
    double hot_path_budget_ms = 16.0;
    int64_t cold_path_timeout_ms = 5000;    // configured, not enforced
    size_t worker_pool_size = 2;

    // Normalization reference canvas
    int reference_width = 1920;
    int reference_height = 1080;

    // Confidence
    uint64_t min_strokes_for_confidence = 50;
    uint64_t max_strokes_for_confidence = 200;
    double session_decay_hours = 24.0;

    // Aesthetic
    double pretty_score_threshold = 0.7;
    AestheticModeConfig strict{0.8, true};
    AestheticModeConfig balanced{0.7, false};
    AestheticModeConfig creative{0.5, false};
    AestheticMode aesthetic_mode = AestheticMode::BALANCED;

    // Temporal
    double fatigue_window_minutes = 15.0;
    double learning_decay_rate = 0.95;
    double session_cooldown_minutes = 30.0;

    // Projection
    size_t umap_n_neighbors = 15;
    double umap_min_dist = 0.1;
    size_t umap_n_components = 3;
    DistanceMetric umap_metric = DistanceMetric::COSINE;

    // Storage
    StorageMode storage_mode = StorageMode::LEVELDB;
    std::string storage_path;               // empty: "sessions" (leveldb) or "sessions.dat" (flatfile)
    int archive_after_days = 30;
    size_t max_sessions_in_memory = 100;

    DistanceWeights weights;

    // Seeds for the deterministic parts of the image encoder and projector
    uint32_t image_seed = 42;
    uint32_t projector_seed = 42;

    const AestheticModeConfig& mode_config(AestheticMode mode) const;
};

/**
 * Build a config from parsed settings.
 *
 * Every key is validated with CConfigValidator first. Invalid values are
 * logged at WARN (CONFIG category) and the built-in default is kept.
 *
 * @param parser Loaded artdna.conf (environment overrides applied by the parser)
 */
DNAConfig LoadDNAConfig(const CConfigParser& parser);

/**
 * Configure the process-wide logger and open its file.
 *
 * Keys: log_level, debug (comma-separated categories, replaces the
 * enabled set), log_console, log_file, log_max_size_mb, log_max_files.
 *
 * @param datadir Directory for artdna.log when log_file is unset; empty
 *                and no log_file means console only
 * @return false if the log file could not be opened
 */
bool InitLogging(const CConfigParser& parser, const std::string& datadir);

} // namespace art_dna

#endif // ARTDNA_DNA_CONFIG_H
