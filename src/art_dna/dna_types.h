// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DNA_TYPES_H
#define ARTDNA_DNA_TYPES_H

/**
 * ArtDNA record types.
 *
 * A DNASession owns three tiers of fingerprints:
 *   StrokeDNA   - one per completed stroke, encoded synchronously (hot path)
 *   ImageDNA    - one per canvas snapshot, encoded on a worker (cold path)
 *   TemporalDNA - session/context aggregate, encoded on a worker (cold path)
 *
 * Records are plain value types. Timestamps are milliseconds since epoch.
 */

#include <art_dna/feature_vector.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace art_dna {

// ---------------------------------------------------------------------------
// Raw input
// ---------------------------------------------------------------------------

struct StrokePoint {
    double x = 0.0;
    double y = 0.0;
    std::optional<double> pressure;     // 0..1
    std::optional<double> timestamp;    // ms
    std::optional<double> tilt_x;
    std::optional<double> tilt_y;
    std::optional<double> twist;
};

struct StrokeInput {
    std::string stroke_id;
    std::string session_id;
    std::vector<StrokePoint> points;
    double canvas_width = 0.0;
    double canvas_height = 0.0;
    std::string tool = "pen";
    std::string color = "#000000";
    int64_t timestamp = 0;
};

/** RGBA, 8 bits per channel, row-major */
struct CanvasSnapshot {
    std::string snapshot_id;
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;
    int64_t timestamp = 0;
};

/** Per-session counters that are not visible in the stroke stream */
struct SessionActivity {
    uint32_t undo_count = 0;
    uint32_t error_count = 0;
};

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

struct Bounds {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

/** Bounds in reference-canvas space plus the scale that produced them */
struct StrokeBounds {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double scale_factor = 1.0;
};

// ---------------------------------------------------------------------------
// DNA records
// ---------------------------------------------------------------------------

struct StrokeDNA {
    std::string dna_id;
    std::string stroke_id;
    std::string session_id;
    StrokeVector features;
    std::optional<StrokeBounds> normalized_bounds;
    std::string tool;
    std::string color;
    int64_t timestamp = 0;
    double encoding_time_ms = 0.0;
};

struct TextureFeatures {
    double complexity = 0.0;
    double contrast = 0.0;
    double energy = 0.0;
};

struct ImageDNA {
    std::string dna_id;
    std::string session_id;
    std::string snapshot_id;
    ImageVector features;
    std::vector<std::string> dominant_colors;   // up to 5, "#rrggbb"
    TextureFeatures texture;
    int width = 0;
    int height = 0;
    int64_t timestamp = 0;
    double encoding_time_ms = 0.0;
};

enum class LearningPhase : uint8_t {
    EXPLORATION = 0,
    REFINEMENT = 1,
    MASTERY = 2
};

std::string LearningPhaseName(LearningPhase phase);

struct TemporalDNA {
    std::string dna_id;
    std::string session_id;
    std::optional<std::string> artist_id;
    TemporalVector features;
    LearningPhase learning_phase = LearningPhase::EXPLORATION;
    double skill_progression = 0.0;
    double fatigue_level = 0.0;
    double focus_score = 1.0;
    bool flow_state_active = false;
    uint32_t total_sessions = 0;
    uint64_t total_strokes = 0;
    int64_t timestamp = 0;
    double encoding_time_ms = 0.0;
};

// ---------------------------------------------------------------------------
// Artist context
// ---------------------------------------------------------------------------

enum class SkillLevel : uint8_t {
    BEGINNER = 0,
    INTERMEDIATE = 1,
    ADVANCED = 2,
    EXPERT = 3
};

std::string SkillLevelName(SkillLevel level);

/** Skill bucket from lifetime stroke count (500 / 2000 / 10000) */
SkillLevel SkillLevelForStrokes(uint64_t lifetime_strokes);

struct ArtistContext {
    std::string context_id;
    std::string session_id;
    std::optional<std::string> artist_id;

    int64_t session_start_time = 0;
    int64_t last_stroke_time = 0;
    uint64_t total_strokes_in_session = 0;

    uint32_t total_sessions = 1;
    uint64_t total_lifetime_strokes = 0;
    SkillLevel skill_level = SkillLevel::BEGINNER;

    double current_fatigue_level = 0.0;
    double consecutive_work_minutes = 0.0;
    int64_t last_break_time = 0;
    uint32_t break_count = 0;

    std::string current_tool = "pen";
    std::string current_color = "#000000";
    double current_brush_size = 5.0;

    std::optional<std::string> session_intent;
    std::optional<std::string> target_outcome;

    int64_t created_at = 0;
    int64_t updated_at = 0;
};

// ---------------------------------------------------------------------------
// Aesthetic score (stored on the session)
// ---------------------------------------------------------------------------

enum class AestheticMode : uint8_t {
    STRICT = 0,
    BALANCED = 1,
    CREATIVE = 2
};

std::string AestheticModeName(AestheticMode mode);
std::optional<AestheticMode> ParseAestheticMode(const std::string& name);

struct PrettyScore {
    std::string score_id;
    std::string session_id;
    double overall_score = 0.0;
    double color_harmony = 0.0;
    double composition_balance = 0.0;
    double visual_complexity = 0.0;
    double style_consistency = 0.0;
    AestheticMode mode = AestheticMode::BALANCED;
    double threshold = 0.0;
    bool passes_threshold = false;
    std::string recommendation;
    int64_t computed_at = 0;
};

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

struct DNASession {
    std::string session_id;
    std::optional<std::string> artist_id;
    std::optional<std::string> name;
    int64_t started_at = 0;
    std::optional<int64_t> ended_at;

    std::vector<StrokeDNA> stroke_dna;
    std::vector<ImageDNA> image_dna;
    std::vector<TemporalDNA> temporal_dna;
    uint64_t total_strokes = 0;

    double confidence_score = 0.0;
    ArtistContext context;

    std::optional<PrettyScore> aesthetic_score;
    AestheticMode aesthetic_mode = AestheticMode::BALANCED;

    /** Append a stroke and keep total_strokes in step with the list */
    void add_stroke(StrokeDNA dna) {
        stroke_dna.push_back(std::move(dna));
        total_strokes = stroke_dna.size();
    }

    const ImageDNA* latest_image() const { return image_dna.empty() ? nullptr : &image_dna.back(); }
    const TemporalDNA* latest_temporal() const { return temporal_dna.empty() ? nullptr : &temporal_dna.back(); }
};

/**
 * Generate a globally unique record id: "<prefix>_" + 32 hex chars
 * (128 bits from the OpenSSL CSPRNG).
 * @throws std::runtime_error if the random source fails
 */
std::string GenerateDNAId(const std::string& prefix);

} // namespace art_dna

#endif // ARTDNA_DNA_TYPES_H
