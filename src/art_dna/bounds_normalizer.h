// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_BOUNDS_NORMALIZER_H
#define ARTDNA_BOUNDS_NORMALIZER_H

#include <art_dna/dna_types.h>

#include <utility>
#include <vector>

namespace art_dna {

struct NormalizedBounds {
    Bounds original;
    Bounds normalized;
    double scale_factor = 1.0;
    int reference_width = 0;
    int reference_height = 0;
};

/**
 * Maps canvas coordinates onto a fixed reference canvas with a single
 * uniform scale, min(ref_w / canvas_w, ref_h / canvas_h), so strokes
 * drawn on differently sized canvases encode comparably.
 *
 * All methods throw InvalidInput when a canvas dimension is not positive.
 */
class BoundsNormalizer {
public:
    BoundsNormalizer(int reference_width = 1920, int reference_height = 1080);

    NormalizedBounds normalize(const Bounds& bounds, double canvas_width, double canvas_height) const;

    /** Inverse of normalize(): reference space back to canvas space */
    Bounds denormalize(const Bounds& normalized, double canvas_width, double canvas_height) const;

    StrokePoint normalize_point(const StrokePoint& point, double canvas_width, double canvas_height) const;

    /** Coordinates are scaled; pressure, timestamp, tilt and twist are kept */
    std::vector<StrokePoint> normalize_points(const std::vector<StrokePoint>& points,
                                              double canvas_width, double canvas_height) const;

    /** Axis-aligned bounding box; all zeros for no points */
    static Bounds calculate_bounds(const std::vector<StrokePoint>& points);

    struct NormalizedStroke {
        std::vector<StrokePoint> points;
        NormalizedBounds bounds;
    };

    NormalizedStroke normalize_stroke(const std::vector<StrokePoint>& points,
                                      double canvas_width, double canvas_height) const;

    double scale_factor(double canvas_width, double canvas_height) const;

    /** (width, height) of the reference canvas */
    std::pair<int, int> get_reference_dimensions() const { return {reference_width_, reference_height_}; }

private:
    int reference_width_;
    int reference_height_;
};

} // namespace art_dna

#endif // ARTDNA_BOUNDS_NORMALIZER_H
