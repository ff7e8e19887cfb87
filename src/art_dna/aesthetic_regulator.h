// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_AESTHETIC_REGULATOR_H
#define ARTDNA_AESTHETIC_REGULATOR_H

/**
 * "Pretty Score" for a session.
 *
 *   overall = 0.3 * color harmony + 0.3 * composition balance
 *           + 0.2 * visual complexity + 0.2 * style consistency
 *
 * Harmony and complexity come from the latest ImageDNA, balance and
 * consistency from the stroke list. The regulator reports whether the
 * score clears the current mode's threshold; acting on that (for
 * instance rejecting output in strict mode) is up to the caller.
 */

#include <art_dna/dna_config.h>
#include <art_dna/dna_types.h>

#include <string>
#include <vector>

namespace art_dna {

class AestheticRegulator {
public:
    explicit AestheticRegulator(const DNAConfig& config = DNAConfig());

    PrettyScore calculate_pretty_score(const DNASession& session) const;

    /** Mean pairwise hue harmony of the dominant colors; 0.5 for fewer than two */
    static double calculate_color_harmony(const std::vector<std::string>& colors);
    static double calculate_color_pair_harmony(const std::string& color1, const std::string& color2);

    /** 0.6 centroid proximity to the reference center + 0.4 quadrant evenness */
    double calculate_composition_balance(const std::vector<StrokeDNA>& strokes) const;

    static double calculate_visual_complexity(const TextureFeatures& texture);

    /** 1.0 for fewer than two strokes */
    static double calculate_style_consistency(const std::vector<StrokeDNA>& strokes);

    void set_mode(AestheticMode mode) { mode_ = mode; }
    AestheticMode get_mode() const { return mode_; }

    double get_threshold() const;
    bool passes_threshold(double score) const;

    /** Whether the current mode asks callers to reject output that fails */
    bool should_reject_below_threshold() const;

private:
    std::string recommendation(const PrettyScore& score) const;

    AestheticModeConfig strict_;
    AestheticModeConfig balanced_;
    AestheticModeConfig creative_;
    AestheticMode mode_;
    double reference_width_;
    double reference_height_;
};

} // namespace art_dna

#endif // ARTDNA_AESTHETIC_REGULATOR_H
