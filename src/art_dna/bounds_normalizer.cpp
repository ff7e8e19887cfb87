// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/bounds_normalizer.h>

#include <util/strencodings.h>

#include <algorithm>

namespace art_dna {

BoundsNormalizer::BoundsNormalizer(int reference_width, int reference_height)
    : reference_width_(reference_width), reference_height_(reference_height)
{
    if (reference_width_ <= 0 || reference_height_ <= 0) {
        throw InvalidInput(CErrorFormatter::InputError("reference canvas",
            strprintf("must be positive, got %dx%d", reference_width_, reference_height_)));
    }
}

double BoundsNormalizer::scale_factor(double canvas_width, double canvas_height) const {
    if (!(canvas_width > 0.0) || !(canvas_height > 0.0)) {
        throw InvalidInput(CErrorFormatter::InputError("canvas",
            strprintf("dimensions must be positive, got %gx%g", canvas_width, canvas_height)));
    }
    return std::min(reference_width_ / canvas_width, reference_height_ / canvas_height);
}

NormalizedBounds BoundsNormalizer::normalize(const Bounds& bounds, double canvas_width, double canvas_height) const {
    double scale = scale_factor(canvas_width, canvas_height);

    NormalizedBounds result;
    result.original = bounds;
    result.normalized.x = bounds.x * scale;
    result.normalized.y = bounds.y * scale;
    result.normalized.width = bounds.width * scale;
    result.normalized.height = bounds.height * scale;
    result.scale_factor = scale;
    result.reference_width = reference_width_;
    result.reference_height = reference_height_;
    return result;
}

Bounds BoundsNormalizer::denormalize(const Bounds& normalized, double canvas_width, double canvas_height) const {
    double scale = 1.0 / scale_factor(canvas_width, canvas_height);

    Bounds result;
    result.x = normalized.x * scale;
    result.y = normalized.y * scale;
    result.width = normalized.width * scale;
    result.height = normalized.height * scale;
    return result;
}

StrokePoint BoundsNormalizer::normalize_point(const StrokePoint& point, double canvas_width, double canvas_height) const {
    double scale = scale_factor(canvas_width, canvas_height);
    StrokePoint result = point;
    result.x = point.x * scale;
    result.y = point.y * scale;
    return result;
}

std::vector<StrokePoint> BoundsNormalizer::normalize_points(const std::vector<StrokePoint>& points,
                                                            double canvas_width, double canvas_height) const {
    double scale = scale_factor(canvas_width, canvas_height);
    std::vector<StrokePoint> result(points);
    for (StrokePoint& p : result) {
        p.x *= scale;
        p.y *= scale;
    }
    return result;
}

Bounds BoundsNormalizer::calculate_bounds(const std::vector<StrokePoint>& points) {
    Bounds bounds;
    if (points.empty()) {
        return bounds;
    }

    double min_x = points[0].x, max_x = points[0].x;
    double min_y = points[0].y, max_y = points[0].y;
    for (const StrokePoint& p : points) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    bounds.x = min_x;
    bounds.y = min_y;
    bounds.width = max_x - min_x;
    bounds.height = max_y - min_y;
    return bounds;
}

BoundsNormalizer::NormalizedStroke BoundsNormalizer::normalize_stroke(const std::vector<StrokePoint>& points,
                                                                      double canvas_width, double canvas_height) const {
    NormalizedStroke result;
    result.points = normalize_points(points, canvas_width, canvas_height);
    result.bounds = normalize(calculate_bounds(points), canvas_width, canvas_height);
    return result;
}

} // namespace art_dna
