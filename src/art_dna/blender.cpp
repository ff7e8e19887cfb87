// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/blender.h>

#include <art_dna/color_utils.h>
#include <art_dna/dna_errors.h>
#include <art_dna/stats.h>
#include <util/time.h>

#include <algorithm>
#include <cmath>

namespace art_dna {

namespace {

template <typename Vec>
Vec LerpFeatures(const Vec& a, const Vec& b, double alpha) {
    Vec result;
    for (size_t i = 0; i < result.size(); i++) {
        result[i] = static_cast<float>(Lerp(a[i], b[i], alpha));
    }
    return result;
}

} // namespace

double Blender::apply_easing(double alpha, BlendingMode mode) {
    switch (mode) {
        case BlendingMode::LINEAR: return alpha;
        case BlendingMode::EASE_IN: return alpha * alpha;
        case BlendingMode::EASE_OUT: return alpha * (2.0 - alpha);
        case BlendingMode::EASE_IN_OUT:
            return alpha < 0.5 ? 2.0 * alpha * alpha : -1.0 + (4.0 - 2.0 * alpha) * alpha;
    }
    return alpha;
}

std::string Blender::blend_colors(const std::string& color_a, const std::string& color_b, double alpha) {
    std::optional<RGBColor> a = ParseHexColor(color_a);
    std::optional<RGBColor> b = ParseHexColor(color_b);
    if (!a || !b) return color_a;

    return ToHexColor(static_cast<int>(std::lround(Lerp(a->r, b->r, alpha))),
                      static_cast<int>(std::lround(Lerp(a->g, b->g, alpha))),
                      static_cast<int>(std::lround(Lerp(a->b, b->b, alpha))));
}

std::vector<std::string> Blender::mix_color_lists(const std::vector<std::string>& a,
                                                  const std::vector<std::string>& b, double alpha) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    size_t count = std::max(a.size(), b.size());
    std::vector<std::string> result;
    result.reserve(count);
    for (size_t i = 0; i < count; i++) {
        const std::string& ca = i < a.size() ? a[i] : a[0];
        const std::string& cb = i < b.size() ? b[i] : b[0];
        result.push_back(blend_colors(ca, cb, alpha));
    }
    return result;
}

StrokeDNA Blender::blend_stroke(const StrokeDNA& a, const StrokeDNA& b, double alpha) const {
    StrokeDNA out;
    out.dna_id = GenerateDNAId("stroke");
    out.stroke_id = GenerateDNAId("blend");
    out.session_id = a.session_id;
    out.features = LerpFeatures(a.features, b.features, alpha);

    if (a.normalized_bounds) {
        StrokeBounds zero;
        zero.scale_factor = 0.0;
        const StrokeBounds& ba = *a.normalized_bounds;
        const StrokeBounds& bb = b.normalized_bounds ? *b.normalized_bounds : zero;
        StrokeBounds bounds;
        bounds.x = Lerp(ba.x, bb.x, alpha);
        bounds.y = Lerp(ba.y, bb.y, alpha);
        bounds.width = Lerp(ba.width, bb.width, alpha);
        bounds.height = Lerp(ba.height, bb.height, alpha);
        bounds.scale_factor = ba.scale_factor;
        out.normalized_bounds = bounds;
    }

    out.tool = alpha < 0.5 ? a.tool : b.tool;
    out.color = blend_colors(a.color, b.color, alpha);
    out.timestamp = GetTimeMillis();
    out.encoding_time_ms = 0.0;
    return out;
}

ImageDNA Blender::blend_image(const ImageDNA& a, const ImageDNA& b, double alpha) const {
    ImageDNA out;
    out.dna_id = GenerateDNAId("image");
    out.session_id = a.session_id;
    out.snapshot_id = GenerateDNAId("snapshot");
    out.features = LerpFeatures(a.features, b.features, alpha);
    out.dominant_colors = mix_color_lists(a.dominant_colors, b.dominant_colors, alpha);
    out.texture.complexity = Lerp(a.texture.complexity, b.texture.complexity, alpha);
    out.texture.contrast = Lerp(a.texture.contrast, b.texture.contrast, alpha);
    out.texture.energy = Lerp(a.texture.energy, b.texture.energy, alpha);
    out.width = static_cast<int>(std::lround(Lerp(a.width, b.width, alpha)));
    out.height = static_cast<int>(std::lround(Lerp(a.height, b.height, alpha)));
    out.timestamp = GetTimeMillis();
    out.encoding_time_ms = 0.0;
    return out;
}

TemporalDNA Blender::blend_temporal(const TemporalDNA& a, const TemporalDNA& b, double alpha) const {
    TemporalDNA out;
    out.dna_id = GenerateDNAId("temporal");
    out.session_id = a.session_id;
    out.artist_id = a.artist_id;
    out.features = LerpFeatures(a.features, b.features, alpha);
    out.learning_phase = alpha < 0.5 ? a.learning_phase : b.learning_phase;
    out.skill_progression = Lerp(a.skill_progression, b.skill_progression, alpha);
    out.fatigue_level = Lerp(a.fatigue_level, b.fatigue_level, alpha);
    out.focus_score = Lerp(a.focus_score, b.focus_score, alpha);
    out.flow_state_active = a.flow_state_active || b.flow_state_active;
    out.total_sessions = static_cast<uint32_t>(std::llround(
        Lerp(static_cast<double>(a.total_sessions), static_cast<double>(b.total_sessions), alpha)));
    out.total_strokes = static_cast<uint64_t>(std::llround(
        Lerp(static_cast<double>(a.total_strokes), static_cast<double>(b.total_strokes), alpha)));
    out.timestamp = GetTimeMillis();
    out.encoding_time_ms = 0.0;
    return out;
}

StrokeDNA Blender::blend_multiple(const std::vector<StrokeDNA>& strokes, const std::vector<double>& weights) const {
    if (strokes.empty()) {
        throw InvalidInput(CErrorFormatter::InputError("blend", "empty list of strokes"));
    }
    if (strokes.size() != weights.size()) {
        throw DimensionMismatch("Stroke and weight counts differ: " + std::to_string(strokes.size()) +
                                " vs " + std::to_string(weights.size()));
    }

    double total_weight = 0.0;
    for (double w : weights) total_weight += w;
    if (!(total_weight > 0.0)) {
        throw InvalidInput(CErrorFormatter::InputError("blend", "weights must sum to a positive value"));
    }

    StrokeVector features;
    for (size_t i = 0; i < features.size(); i++) {
        double sum = 0.0;
        for (size_t j = 0; j < strokes.size(); j++) {
            sum += strokes[j].features[i] * (weights[j] / total_weight);
        }
        features[i] = static_cast<float>(sum);
    }

    size_t dominant = static_cast<size_t>(std::max_element(weights.begin(), weights.end()) - weights.begin());

    StrokeDNA out;
    out.dna_id = GenerateDNAId("stroke");
    out.stroke_id = GenerateDNAId("blend");
    out.session_id = strokes[0].session_id;
    out.features = features;
    out.normalized_bounds = strokes[dominant].normalized_bounds;
    out.tool = strokes[dominant].tool;
    out.color = strokes[dominant].color;
    out.timestamp = GetTimeMillis();
    out.encoding_time_ms = 0.0;
    return out;
}

StrokeDNA Blender::blend_with_easing(const StrokeDNA& a, const StrokeDNA& b, double alpha, BlendingMode mode) const {
    return blend_stroke(a, b, apply_easing(alpha, mode));
}

} // namespace art_dna
