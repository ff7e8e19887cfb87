// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_BLENDER_H
#define ARTDNA_BLENDER_H

/**
 * Interpolation between DNA records.
 *
 * Features are lerped slot by slot at alpha in [0, 1]. Categorical fields
 * (tool, learning phase) switch from a to b at alpha 0.5. Hex colors are
 * interpolated per RGB channel; a color that does not parse as #rrggbb
 * keeps the first record's value. Every blended record gets fresh ids
 * and encoding_time_ms 0.
 */

#include <art_dna/dna_types.h>

#include <string>
#include <vector>

namespace art_dna {

enum class BlendingMode : uint8_t {
    LINEAR = 0,
    EASE_IN,
    EASE_OUT,
    EASE_IN_OUT
};

class Blender {
public:
    StrokeDNA blend_stroke(const StrokeDNA& a, const StrokeDNA& b, double alpha) const;
    ImageDNA blend_image(const ImageDNA& a, const ImageDNA& b, double alpha) const;
    TemporalDNA blend_temporal(const TemporalDNA& a, const TemporalDNA& b, double alpha) const;

    /**
     * Weight-normalized average of N strokes. Tool, color and bounds come
     * from the highest-weighted stroke (the first one on a tie).
     * @throws InvalidInput on an empty list or a non-positive weight sum
     * @throws DimensionMismatch if weights and strokes differ in count
     */
    StrokeDNA blend_multiple(const std::vector<StrokeDNA>& strokes, const std::vector<double>& weights) const;

    StrokeDNA blend_with_easing(const StrokeDNA& a, const StrokeDNA& b, double alpha, BlendingMode mode) const;

    static double apply_easing(double alpha, BlendingMode mode);

    /** Per-channel mix of two "#rrggbb" colors; color_a if either fails to parse */
    static std::string blend_colors(const std::string& color_a, const std::string& color_b, double alpha);

    /**
     * Pairwise mix up to the longer list. A missing entry falls back to
     * that list's first color; an empty list contributes the other side's
     * color unchanged.
     */
    static std::vector<std::string> mix_color_lists(const std::vector<std::string>& a,
                                                    const std::vector<std::string>& b, double alpha);
};

} // namespace art_dna

#endif // ARTDNA_BLENDER_H
