// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_CONFIDENCE_SCORER_H
#define ARTDNA_CONFIDENCE_SCORER_H

/**
 * How representative a session is as a style sample.
 *
 *   overall = 0.5 * stroke count + 0.3 * session age + 0.2 * completeness
 *
 * Stroke count ramps from 0 at the low watermark to 1 at the high one,
 * age decays as exp(-0.1 * age_h / decay_h), and completeness counts
 * the DNA tiers present (1/3 each).
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

#include <optional>
#include <string>
#include <vector>

namespace art_dna {

struct ConfidenceScore {
    std::string confidence_id;
    std::string session_id;
    double overall_confidence = 0.0;
    double stroke_count_confidence = 0.0;
    double session_age_confidence = 0.0;
    double completeness_confidence = 0.0;
    uint64_t total_strokes = 0;
    double session_age_hours = 0.0;
    int64_t computed_at = 0;
};

enum class ConfidenceCategory : uint8_t {
    LOW = 0,
    MEDIUM,
    HIGH
};

std::string ConfidenceCategoryName(ConfidenceCategory category);

class ConfidenceScorer {
public:
    explicit ConfidenceScorer(const DNAConfig& config = DNAConfig());

    /** Score against the given wall-clock time (ms since epoch) */
    ConfidenceScore calculate(const DNASession& session, int64_t now_ms) const;

    std::vector<ConfidenceScore> calculate_batch(const std::vector<DNASession>& sessions, int64_t now_ms) const;

    /** Index of the first session with the highest overall score; nullopt when empty */
    std::optional<size_t> select_highest_confidence(const std::vector<DNASession>& sessions, int64_t now_ms) const;

    double stroke_count_confidence(uint64_t strokes) const;
    double session_age_confidence(double age_hours) const;
    static double completeness_confidence(const DNASession& session);

    static ConfidenceCategory get_category(double score);
    static std::string get_recommendation(const ConfidenceScore& score);
    static bool meets_minimum_threshold(const ConfidenceScore& score, double threshold = 0.5);

private:
    uint64_t min_strokes_;
    uint64_t max_strokes_;
    double decay_hours_;
};

} // namespace art_dna

#endif // ARTDNA_CONFIDENCE_SCORER_H
