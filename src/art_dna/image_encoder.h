// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_IMAGE_ENCODER_H
#define ARTDNA_IMAGE_ENCODER_H

/**
 * Image DNA encoder (cold path).
 *
 * Five bands over an RGBA canvas snapshot:
 *   0-63    edge strength (mean |dGray| vertical / horizontal)
 *   64-127  8-bin gradient orientation histogram, max-normalized
 *   128-255 16-bin R/G/B histograms, pattern slots
 *   256-383 structural slots
 *   384-511 semantic slots
 *
 * Slots without a measured feature are filled from a SeededRNG, so an
 * identical snapshot always yields an identical vector.
 *
 * This encoder is too slow for the hot path. encode() runs it on a
 * background thread; DNAWorker calls encode_in_worker() directly from
 * the worker pool. encode_sync() exists only to fail loudly.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

#include <future>
#include <string>
#include <vector>

namespace art_dna {

class ImageEncoder {
public:
    explicit ImageEncoder(const DNAConfig& config = DNAConfig());

    /** Encode on a background thread */
    std::future<ImageDNA> encode(const CanvasSnapshot& snapshot, const std::string& session_id) const;

    /**
     * Encode on the calling thread. Only for code already running off the
     * hot path (worker pool tasks).
     * @throws InvalidInput if the snapshot is smaller than 2x2 or the
     *         buffer size does not match width * height * 4
     */
    ImageDNA encode_in_worker(const CanvasSnapshot& snapshot, const std::string& session_id) const;

    /** @throws std::logic_error always */
    ImageDNA encode_sync(const CanvasSnapshot& snapshot, const std::string& session_id) const;

    /** Up to k colors as "#rrggbb", k-means over every 10th pixel */
    std::vector<std::string> extract_dominant_colors(const CanvasSnapshot& snapshot, size_t k = 5) const;

    static TextureFeatures extract_texture(const CanvasSnapshot& snapshot);

    static constexpr size_t dimension() { return IMAGE_DIMENSIONS; }

private:
    uint32_t seed_;
};

} // namespace art_dna

#endif // ARTDNA_IMAGE_ENCODER_H
