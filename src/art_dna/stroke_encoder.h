// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STROKE_ENCODER_H
#define ARTDNA_STROKE_ENCODER_H

/**
 * Stroke DNA encoder (hot path).
 *
 * Turns one completed stroke into a 30-dim vector:
 *   0-9   geometric   (normalized coordinates)
 *   10-19 statistical (normalized coordinates)
 *   20-29 dynamic     (raw coordinates and timing)
 *
 * Runs synchronously on the caller's thread. Const and stateless, so
 * one instance may be shared between threads.
 */

#include <art_dna/bounds_normalizer.h>
#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

namespace art_dna {

class StrokeEncoder {
public:
    explicit StrokeEncoder(const DNAConfig& config = DNAConfig());

    /**
     * Encode a stroke.
     * @param input   Raw stroke; not modified
     * @param context Optional artist context, supplies the session id when
     *                the input carries none
     * @throws InvalidInput if the stroke has no points or the canvas is degenerate
     */
    StrokeDNA encode(const StrokeInput& input, const ArtistContext* context = nullptr) const;

    static constexpr size_t dimension() { return STROKE_DIMENSIONS; }

    const BoundsNormalizer& normalizer() const { return normalizer_; }

private:
    BoundsNormalizer normalizer_;
};

} // namespace art_dna

#endif // ARTDNA_STROKE_ENCODER_H
