// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_TEMPORAL_ENCODER_H
#define ARTDNA_TEMPORAL_ENCODER_H

/**
 * Temporal DNA encoder (cold path).
 *
 * Aggregates the session's strokes and the live ArtistContext into
 *   0-9   learning metrics
 *   10-19 fatigue indicators
 *   20-29 style evolution
 *   30-31 reserved
 *
 * Like the image encoder it is never run on the hot path; see
 * ImageEncoder for the encode / encode_in_worker / encode_sync split.
 */

#include <art_dna/dna_types.h>

#include <future>
#include <map>
#include <string>

namespace art_dna {

struct SessionStatistics {
    uint32_t total_sessions = 1;
    uint64_t total_strokes = 0;
    double avg_stroke_length = 0.0;
    double preferred_velocity = 0.0;
    double preferred_pressure = 0.0;
    std::map<std::string, uint32_t> tool_usage;
    std::map<std::string, uint32_t> color_usage;
    uint32_t undo_count = 0;
    uint32_t error_count = 0;
    uint32_t break_count = 0;
};

class TemporalEncoder {
public:
    /** Encode on a background thread. Session and context are copied. */
    std::future<TemporalDNA> encode(const DNASession& session, const ArtistContext& context,
                                    const SessionActivity& activity = SessionActivity()) const;

    /** Encode on the calling thread; worker pool tasks only */
    TemporalDNA encode_in_worker(const DNASession& session, const ArtistContext& context,
                                 const SessionActivity& activity = SessionActivity()) const;

    /** @throws std::logic_error always */
    TemporalDNA encode_sync(const DNASession& session, const ArtistContext& context) const;

    static SessionStatistics calculate_statistics(const DNASession& session, const ArtistContext& context,
                                                  const SessionActivity& activity);

    static LearningPhase determine_learning_phase(const TemporalVector& features);

    /** log10-scaled stroke count blended with tool diversity, in [0, 1] */
    static double calculate_skill_progression(const SessionStatistics& stats);

    static constexpr size_t dimension() { return TEMPORAL_DIMENSIONS; }
};

} // namespace art_dna

#endif // ARTDNA_TEMPORAL_ENCODER_H
