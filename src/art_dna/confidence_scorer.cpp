// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/confidence_scorer.h>

#include <art_dna/stats.h>

#include <cmath>

namespace art_dna {

static constexpr double MS_PER_HOUR = 3600000.0;
static constexpr double AGE_DECAY_RATE = 0.1;

std::string ConfidenceCategoryName(ConfidenceCategory category) {
    switch (category) {
        case ConfidenceCategory::LOW: return "low";
        case ConfidenceCategory::MEDIUM: return "medium";
        case ConfidenceCategory::HIGH: return "high";
    }
    return "low";
}

ConfidenceScorer::ConfidenceScorer(const DNAConfig& config)
    : min_strokes_(config.min_strokes_for_confidence),
      max_strokes_(config.max_strokes_for_confidence),
      decay_hours_(config.session_decay_hours) {}

double ConfidenceScorer::stroke_count_confidence(uint64_t strokes) const {
    if (strokes <= min_strokes_) return 0.0;
    if (strokes >= max_strokes_) return 1.0;
    return static_cast<double>(strokes - min_strokes_) / static_cast<double>(max_strokes_ - min_strokes_);
}

double ConfidenceScorer::session_age_confidence(double age_hours) const {
    if (decay_hours_ <= 0.0) return 0.0;
    return Clamp01(std::exp(-AGE_DECAY_RATE * (age_hours / decay_hours_)));
}

double ConfidenceScorer::completeness_confidence(const DNASession& session) {
    double score = 0.0;
    if (!session.stroke_dna.empty()) score += 1.0 / 3.0;
    if (!session.image_dna.empty()) score += 1.0 / 3.0;
    if (!session.temporal_dna.empty()) score += 1.0 / 3.0;
    return score;
}

ConfidenceScore ConfidenceScorer::calculate(const DNASession& session, int64_t now_ms) const {
    ConfidenceScore score;
    score.confidence_id = GenerateDNAId("confidence");
    score.session_id = session.session_id;
    score.total_strokes = session.total_strokes;
    score.session_age_hours = (now_ms - session.started_at) / MS_PER_HOUR;

    score.stroke_count_confidence = stroke_count_confidence(session.total_strokes);
    score.session_age_confidence = session_age_confidence(score.session_age_hours);
    score.completeness_confidence = completeness_confidence(session);
    score.overall_confidence = score.stroke_count_confidence * 0.5 +
                               score.session_age_confidence * 0.3 +
                               score.completeness_confidence * 0.2;
    score.computed_at = now_ms;
    return score;
}

std::vector<ConfidenceScore> ConfidenceScorer::calculate_batch(const std::vector<DNASession>& sessions,
                                                               int64_t now_ms) const {
    std::vector<ConfidenceScore> scores;
    scores.reserve(sessions.size());
    for (const DNASession& session : sessions) {
        scores.push_back(calculate(session, now_ms));
    }
    return scores;
}

std::optional<size_t> ConfidenceScorer::select_highest_confidence(const std::vector<DNASession>& sessions,
                                                                  int64_t now_ms) const {
    if (sessions.empty()) return std::nullopt;

    std::vector<ConfidenceScore> scores = calculate_batch(sessions, now_ms);
    size_t best = 0;
    for (size_t i = 1; i < scores.size(); i++) {
        if (scores[i].overall_confidence > scores[best].overall_confidence) best = i;
    }
    return best;
}

ConfidenceCategory ConfidenceScorer::get_category(double score) {
    if (score < 0.4) return ConfidenceCategory::LOW;
    if (score < 0.7) return ConfidenceCategory::MEDIUM;
    return ConfidenceCategory::HIGH;
}

std::string ConfidenceScorer::get_recommendation(const ConfidenceScore& score) {
    switch (get_category(score.overall_confidence)) {
        case ConfidenceCategory::LOW:
            if (score.stroke_count_confidence < 0.5) {
                return "Add more strokes to improve confidence. Current: " + std::to_string(score.total_strokes);
            }
            if (score.completeness_confidence < 0.5) {
                return "Session is incomplete. Ensure all DNA tiers are encoded.";
            }
            return "Session is too old. Consider creating a new session.";
        case ConfidenceCategory::MEDIUM:
            return "Session confidence is moderate. Additional strokes will improve accuracy.";
        case ConfidenceCategory::HIGH:
            break;
    }
    return "Session is highly representative. Safe to use for style matching.";
}

bool ConfidenceScorer::meets_minimum_threshold(const ConfidenceScore& score, double threshold) {
    return score.overall_confidence >= threshold;
}

} // namespace art_dna
