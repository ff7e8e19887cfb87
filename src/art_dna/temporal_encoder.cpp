// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/temporal_encoder.h>

#include <art_dna/stats.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace art_dna {

namespace {

// Shannon entropy (bits) of a usage histogram
double Entropy(const std::map<std::string, uint32_t>& usage) {
    double total = 0.0;
    for (const auto& entry : usage) total += entry.second;
    if (total == 0.0) return 0.0;

    double entropy = 0.0;
    for (const auto& entry : usage) {
        if (entry.second > 0) {
            double p = entry.second / total;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}

double Rate(uint32_t count, uint64_t strokes) {
    return strokes > 0 ? std::min(static_cast<double>(count) / strokes, 1.0) : 0.0;
}

void ExtractLearning(const SessionStatistics& stats, const ArtistContext& context, TemporalVector& f) {
    f.set(TemporalFeature::SESSION_COUNT, context.total_sessions);
    f.set(TemporalFeature::TOTAL_STROKES, static_cast<double>(context.total_lifetime_strokes));
    f.set(TemporalFeature::AVG_STROKE_LENGTH, std::min(stats.avg_stroke_length / 1000.0, 1.0));
    f.set(TemporalFeature::PREFERRED_VELOCITY, std::min(stats.preferred_velocity / 100.0, 1.0));
    f.set(TemporalFeature::PREFERRED_PRESSURE, stats.preferred_pressure);
    f.set(TemporalFeature::TOOL_DIVERSITY, std::min(stats.tool_usage.size() / 10.0, 1.0));
    f.set(TemporalFeature::COLOR_PALETTE_SIZE, std::min(stats.color_usage.size() / 20.0, 1.0));
    f.set(TemporalFeature::COMPOSITION_BIAS, 0.5);
    f.set(TemporalFeature::REVISION_RATE, Rate(stats.undo_count, stats.total_strokes));
    f.set(TemporalFeature::COMPLETION_RATE, 0.8);
}

void ExtractFatigue(const SessionStatistics& stats, const ArtistContext& context, TemporalVector& f) {
    static const double MAX_ENTROPY = std::log2(10.0);  // ~10 tools or colors

    double consistency = 1.0 - (Entropy(stats.tool_usage) + Entropy(stats.color_usage)) / (2.0 * MAX_ENTROPY);
    double error_frequency = Rate(stats.error_count, stats.total_strokes);
    double focus = 1.0 - context.current_fatigue_level * 0.7 - error_frequency * 0.3;

    f.set(TemporalFeature::CURRENT_FATIGUE_LEVEL, context.current_fatigue_level);
    f.set(TemporalFeature::STROKE_CONSISTENCY, Clamp01(consistency));
    f.set(TemporalFeature::ERROR_FREQUENCY, error_frequency);
    f.set(TemporalFeature::UNDO_RATE, Rate(stats.undo_count, stats.total_strokes));
    f.set(TemporalFeature::PAUSE_FREQUENCY, 0.1);
    f.set(TemporalFeature::VELOCITY_VARIANCE, 0.3);
    f.set(TemporalFeature::PRESSURE_STABILITY, 0.7);
    f.set(TemporalFeature::SESSION_DURATION, std::min(context.consecutive_work_minutes / 60.0 / 4.0, 1.0));
    f.set(TemporalFeature::BREAK_COUNT, std::min(stats.break_count / 10.0, 1.0));
    f.set(TemporalFeature::FOCUS_SCORE, Clamp01(focus));
}

void ExtractStyle(const DNASession& session, TemporalVector& f) {
    std::set<std::string> tools, colors;
    for (const StrokeDNA& stroke : session.stroke_dna) {
        tools.insert(stroke.tool);
        colors.insert(stroke.color);
    }
    size_t strokes = session.stroke_dna.size();

    // Distinct tools+colors per ten strokes; an empty session has explored nothing
    double exploration = strokes > 0 ? (tools.size() + colors.size()) / (strokes * 0.1) : 0.0;
    double refinement = std::max(0.0, 1.0 - exploration);

    f.set(TemporalFeature::STYLE_DRIFT_RATE, 0.2);
    f.set(TemporalFeature::EXPLORATION_SCORE, std::min(exploration, 1.0));
    f.set(TemporalFeature::REFINEMENT_SCORE, refinement);
    f.set(TemporalFeature::EXPERIMENTATION_RATE,
          std::min(static_cast<double>(tools.size()) / std::max<size_t>(strokes, 1), 1.0));
    f.set(TemporalFeature::COMFORT_ZONE_RADIUS, 0.5);
    f.set(TemporalFeature::NOVELTY_SEEKING, Clamp01(exploration));
    f.set(TemporalFeature::PATTERN_REPETITION, Clamp01(1.0 - exploration));
    f.set(TemporalFeature::CREATIVE_BURST_COUNT, 0.0);
    f.set(TemporalFeature::DELIBERATE_PRACTICE_TIME, 0.6);

    bool flow = f.get(TemporalFeature::FOCUS_SCORE) > 0.7f &&
                f.get(TemporalFeature::CURRENT_FATIGUE_LEVEL) < 0.3f;
    f.set(TemporalFeature::FLOW_STATE_DURATION, flow ? 1.0 : 0.0);
    f.set(TemporalFeature::RESERVED_1, 0.0);
    f.set(TemporalFeature::RESERVED_2, 0.0);
}

} // namespace

SessionStatistics TemporalEncoder::calculate_statistics(const DNASession& session, const ArtistContext& context,
                                                        const SessionActivity& activity) {
    SessionStatistics stats;
    double total_velocity = 0.0;
    double total_pressure = 0.0;
    double total_length = 0.0;

    for (const StrokeDNA& stroke : session.stroke_dna) {
        stats.tool_usage[stroke.tool]++;
        stats.color_usage[stroke.color]++;
        total_velocity += stroke.features.get(StrokeFeature::AVG_VELOCITY);
        total_pressure += stroke.features.get(StrokeFeature::PRESSURE_MEAN);
        total_length += stroke.features.get(StrokeFeature::PERIMETER);
    }

    size_t count = session.stroke_dna.size();
    stats.total_sessions = context.total_sessions;
    stats.total_strokes = count;
    if (count > 0) {
        stats.avg_stroke_length = total_length / count;
        stats.preferred_velocity = total_velocity / count;
        stats.preferred_pressure = total_pressure / count;
    }
    stats.undo_count = activity.undo_count;
    stats.error_count = activity.error_count;
    stats.break_count = context.break_count;
    return stats;
}

LearningPhase TemporalEncoder::determine_learning_phase(const TemporalVector& features) {
    double exploration = features.get(TemporalFeature::EXPLORATION_SCORE);
    double refinement = features.get(TemporalFeature::REFINEMENT_SCORE);
    double lifetime_strokes = features.get(TemporalFeature::TOTAL_STROKES);

    if (lifetime_strokes < 1000) {
        return LearningPhase::EXPLORATION;
    }
    if (lifetime_strokes > 5000 && refinement > 0.7) {
        return LearningPhase::MASTERY;
    }
    if (refinement > exploration) {
        return LearningPhase::REFINEMENT;
    }
    return LearningPhase::EXPLORATION;
}

double TemporalEncoder::calculate_skill_progression(const SessionStatistics& stats) {
    double stroke_factor = std::log10(static_cast<double>(stats.total_strokes) + 1.0) / 5.0;  // 1.0 at 100k
    double diversity_factor = std::min(stats.tool_usage.size() / 10.0, 1.0);
    return std::min((stroke_factor + diversity_factor) / 2.0, 1.0);
}

std::future<TemporalDNA> TemporalEncoder::encode(const DNASession& session, const ArtistContext& context,
                                                 const SessionActivity& activity) const {
    return std::async(std::launch::async, [encoder = *this, session, context, activity]() {
        return encoder.encode_in_worker(session, context, activity);
    });
}

TemporalDNA TemporalEncoder::encode_sync(const DNASession&, const ArtistContext&) const {
    throw std::logic_error("TemporalDNA encoding must be async (use encode() or the worker pool)");
}

TemporalDNA TemporalEncoder::encode_in_worker(const DNASession& session, const ArtistContext& context,
                                              const SessionActivity& activity) const {
    double start = GetSteadyMillis();

    SessionStatistics stats = calculate_statistics(session, context, activity);

    TemporalDNA dna;
    ExtractLearning(stats, context, dna.features);
    ExtractFatigue(stats, context, dna.features);
    ExtractStyle(session, dna.features);

    dna.dna_id = GenerateDNAId("temporal");
    dna.session_id = session.session_id;
    dna.artist_id = context.artist_id ? context.artist_id : session.artist_id;
    dna.learning_phase = determine_learning_phase(dna.features);
    dna.skill_progression = calculate_skill_progression(stats);
    dna.fatigue_level = dna.features.get(TemporalFeature::CURRENT_FATIGUE_LEVEL);
    dna.focus_score = dna.features.get(TemporalFeature::FOCUS_SCORE);
    dna.flow_state_active = dna.features.get(TemporalFeature::FLOW_STATE_DURATION) > 0.5f;
    dna.total_sessions = stats.total_sessions;
    dna.total_strokes = stats.total_strokes;
    dna.timestamp = GetTimeMillis();
    dna.encoding_time_ms = std::max(0.0, GetSteadyMillis() - start);

    LogPrintEncoder(DEBUG, "Temporal DNA %s for session %s: phase=%s fatigue=%.2f focus=%.2f",
                    dna.dna_id.c_str(), dna.session_id.c_str(),
                    LearningPhaseName(dna.learning_phase).c_str(), dna.fatigue_level, dna.focus_score);
    return dna;
}

} // namespace art_dna
