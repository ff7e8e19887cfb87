// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/aesthetic_regulator.h>

#include <art_dna/color_utils.h>
#include <art_dna/stats.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <cmath>
#include <set>

namespace art_dna {

AestheticRegulator::AestheticRegulator(const DNAConfig& config)
    : strict_(config.strict),
      balanced_(config.balanced),
      creative_(config.creative),
      mode_(config.aesthetic_mode),
      reference_width_(config.reference_width),
      reference_height_(config.reference_height) {}

double AestheticRegulator::calculate_color_pair_harmony(const std::string& color1, const std::string& color2) {
    std::optional<RGBColor> rgb1 = ParseHexColor(color1);
    std::optional<RGBColor> rgb2 = ParseHexColor(color2);
    if (!rgb1 || !rgb2) return 0.5;

    HSVColor hsv1 = RgbToHsv(*rgb1);
    HSVColor hsv2 = RgbToHsv(*rgb2);
    double hue_diff = std::fabs(hsv1.h - hsv2.h);

    if (std::fabs(hue_diff - 180.0) < 30.0) return 0.9;                                    // complementary
    if (std::fabs(hue_diff - 120.0) < 30.0 || std::fabs(hue_diff - 240.0) < 30.0) return 0.85;  // triadic
    if (hue_diff < 60.0) return 0.8;                                                         // analogous

    double sat_diff = std::fabs(hsv1.s - hsv2.s);
    double val_diff = std::fabs(hsv1.v - hsv2.v);
    return (1.0 - (sat_diff + val_diff) / 2.0) * 0.7;
}

double AestheticRegulator::calculate_color_harmony(const std::vector<std::string>& colors) {
    if (colors.size() < 2) return 0.5;

    double total = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i + 1 < colors.size(); i++) {
        for (size_t j = i + 1; j < colors.size(); j++) {
            total += calculate_color_pair_harmony(colors[i], colors[j]);
            pairs++;
        }
    }
    return total / static_cast<double>(pairs);
}

double AestheticRegulator::calculate_composition_balance(const std::vector<StrokeDNA>& strokes) const {
    if (strokes.empty()) return 0.5;

    double ref_cx = reference_width_ / 2.0;
    double ref_cy = reference_height_ / 2.0;

    double sum_x = 0.0, sum_y = 0.0;
    double quadrants[4] = {0.0, 0.0, 0.0, 0.0};  // TL, TR, BL, BR
    for (const StrokeDNA& stroke : strokes) {
        double x = stroke.features.get(StrokeFeature::MEAN_X);
        double y = stroke.features.get(StrokeFeature::MEAN_Y);
        sum_x += x;
        sum_y += y;

        bool left = x < ref_cx;
        bool top = y < ref_cy;
        quadrants[(top ? 0 : 2) + (left ? 0 : 1)] += 1.0;
    }

    double n = static_cast<double>(strokes.size());
    double cx = sum_x / n;
    double cy = sum_y / n;
    double offset = std::sqrt((cx - ref_cx) * (cx - ref_cx) + (cy - ref_cy) * (cy - ref_cy));
    double max_offset = std::sqrt(ref_cx * ref_cx + ref_cy * ref_cy);
    double centering = 1.0 - offset / max_offset;

    double variance = 0.0;
    for (double q : quadrants) {
        double share = q / n;
        variance += (share - 0.25) * (share - 0.25);
    }
    variance /= 4.0;
    double distribution = 1.0 - std::min(variance * 4.0, 1.0);

    return centering * 0.6 + distribution * 0.4;
}

double AestheticRegulator::calculate_visual_complexity(const TextureFeatures& texture) {
    double complexity_score = 1.0 - std::fabs(texture.complexity - 0.5) * 2.0;
    double energy_score = 1.0 - std::fabs(texture.energy - 0.5) * 2.0;
    return complexity_score * 0.5 + texture.contrast * 0.3 + energy_score * 0.2;
}

double AestheticRegulator::calculate_style_consistency(const std::vector<StrokeDNA>& strokes) {
    if (strokes.size() < 2) return 1.0;

    static const StrokeFeature KEY_FEATURES[] = {
        StrokeFeature::WIDTH,
        StrokeFeature::HEIGHT,
        StrokeFeature::ASPECT_RATIO,
        StrokeFeature::AVG_VELOCITY,
        StrokeFeature::PRESSURE_MEAN,
    };

    double feature_consistency = 0.0;
    for (StrokeFeature feature : KEY_FEATURES) {
        std::vector<double> values;
        values.reserve(strokes.size());
        for (const StrokeDNA& stroke : strokes) values.push_back(stroke.features.get(feature));

        double mean = Mean(values);
        double cv = mean != 0.0 ? StdDev(values) / std::fabs(mean) : 0.0;
        feature_consistency += 1.0 - std::min(cv, 1.0);
    }
    feature_consistency /= 5.0;

    std::set<std::string> tools, colors;
    for (const StrokeDNA& stroke : strokes) {
        tools.insert(stroke.tool);
        colors.insert(stroke.color);
    }
    double tool_consistency = 1.0 - std::min(tools.size() / 10.0, 1.0);
    double color_consistency = 1.0 - std::min(colors.size() / 20.0, 1.0);

    return feature_consistency * 0.5 + tool_consistency * 0.25 + color_consistency * 0.25;
}

double AestheticRegulator::get_threshold() const {
    switch (mode_) {
        case AestheticMode::STRICT: return strict_.threshold;
        case AestheticMode::CREATIVE: return creative_.threshold;
        case AestheticMode::BALANCED: break;
    }
    return balanced_.threshold;
}

bool AestheticRegulator::passes_threshold(double score) const {
    return score >= get_threshold();
}

bool AestheticRegulator::should_reject_below_threshold() const {
    switch (mode_) {
        case AestheticMode::STRICT: return strict_.reject_below;
        case AestheticMode::CREATIVE: return creative_.reject_below;
        case AestheticMode::BALANCED: break;
    }
    return balanced_.reject_below;
}

std::string AestheticRegulator::recommendation(const PrettyScore& score) const {
    if (score.passes_threshold) {
        if (score.overall_score >= 0.9) {
            return "Excellent aesthetic quality! Your work shows strong harmony and balance.";
        }
        if (score.overall_score >= 0.8) {
            return "Good aesthetic quality. Minor refinements could elevate it further.";
        }
        return "Meets aesthetic standards. Consider exploring variations.";
    }

    // Weakest component; the first listed wins a tie
    const std::pair<double, const char*> components[] = {
        {score.color_harmony,
         "Color harmony could be improved. Try complementary or analogous color schemes."},
        {score.composition_balance,
         "Composition balance needs attention. Consider distributing elements more evenly."},
        {score.visual_complexity,
         "Visual complexity is off. Aim for moderate detail, not too simple and not too busy."},
        {score.style_consistency,
         "Style consistency needs work. Try maintaining similar stroke characteristics."},
    };
    size_t weakest = 0;
    for (size_t i = 1; i < 4; i++) {
        if (components[i].first < components[weakest].first) weakest = i;
    }
    return components[weakest].second;
}

PrettyScore AestheticRegulator::calculate_pretty_score(const DNASession& session) const {
    PrettyScore score;
    score.score_id = GenerateDNAId("score");
    score.session_id = session.session_id;
    score.mode = mode_;
    score.threshold = get_threshold();
    score.computed_at = GetTimeMillis();

    const ImageDNA* image = session.latest_image();
    if (!image) {
        score.overall_score = 0.5;
        score.color_harmony = 0.5;
        score.composition_balance = 0.5;
        score.visual_complexity = 0.5;
        score.style_consistency = 0.5;
        score.passes_threshold = false;
        score.recommendation = "Add strokes to generate aesthetic analysis.";
        return score;
    }

    score.color_harmony = calculate_color_harmony(image->dominant_colors);
    score.composition_balance = calculate_composition_balance(session.stroke_dna);
    score.visual_complexity = calculate_visual_complexity(image->texture);
    score.style_consistency = calculate_style_consistency(session.stroke_dna);
    score.overall_score = score.color_harmony * 0.3 +
                          score.composition_balance * 0.3 +
                          score.visual_complexity * 0.2 +
                          score.style_consistency * 0.2;
    score.passes_threshold = passes_threshold(score.overall_score);
    score.recommendation = recommendation(score);

    LogPrintAnalysis(DEBUG, "Pretty score %.3f for session %s (%s, threshold %.2f, %s)",
                     score.overall_score, session.session_id.c_str(), AestheticModeName(mode_).c_str(),
                     score.threshold, score.passes_threshold ? "pass" : "fail");
    return score;
}

} // namespace art_dna
