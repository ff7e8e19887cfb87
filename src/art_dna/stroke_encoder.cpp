// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/stroke_encoder.h>

#include <art_dna/stats.h>
#include <util/logging.h>
#include <util/time.h>

#include <algorithm>
#include <cmath>

namespace art_dna {

namespace {

static const double DEFAULT_FRAME_SECONDS = 0.016;   // 60 fps
static const double PAUSE_THRESHOLD_SECONDS = 0.1;
static const double CORNER_THRESHOLD_RADIANS = 0.5;
static const double DEFAULT_PRESSURE = 0.5;

double Skewness(const std::vector<double>& values) {
    double std_dev = StdDev(values);
    if (std_dev == 0.0) return 0.0;
    double mean = Mean(values);
    double sum = 0.0;
    for (double v : values) sum += std::pow((v - mean) / std_dev, 3);
    return sum / static_cast<double>(values.size());
}

// Excess kurtosis
double Kurtosis(const std::vector<double>& values) {
    double std_dev = StdDev(values);
    if (std_dev == 0.0) return 0.0;
    double mean = Mean(values);
    double sum = 0.0;
    for (double v : values) sum += std::pow((v - mean) / std_dev, 4);
    return sum / static_cast<double>(values.size()) - 3.0;
}

double Perimeter(const std::vector<StrokePoint>& points) {
    double perimeter = 0.0;
    for (size_t i = 1; i < points.size(); i++) {
        perimeter += std::hypot(points[i].x - points[i - 1].x, points[i].y - points[i - 1].y);
    }
    return perimeter;
}

// Ratio of the covariance eigenvalues, 1 for degenerate (line or point) strokes
double Elongation(const std::vector<StrokePoint>& points, double mean_x, double mean_y) {
    double cov_xx = 0.0, cov_yy = 0.0, cov_xy = 0.0;
    for (const StrokePoint& p : points) {
        double dx = p.x - mean_x;
        double dy = p.y - mean_y;
        cov_xx += dx * dx;
        cov_yy += dy * dy;
        cov_xy += dx * dy;
    }
    double n = static_cast<double>(points.size());
    cov_xx /= n;
    cov_yy /= n;
    cov_xy /= n;

    double trace = cov_xx + cov_yy;
    double det = cov_xx * cov_yy - cov_xy * cov_xy;
    double root = std::sqrt(std::max(0.0, trace * trace / 4.0 - det));
    double lambda1 = trace / 2.0 + root;
    double lambda2 = trace / 2.0 - root;
    return lambda2 > 0.0 ? lambda1 / lambda2 : 1.0;
}

double Orientation(const std::vector<StrokePoint>& points, double mean_x, double mean_y) {
    double cov_xx = 0.0, cov_xy = 0.0;
    for (const StrokePoint& p : points) {
        double dx = p.x - mean_x;
        double dy = p.y - mean_y;
        cov_xx += dx * dx;
        cov_xy += dx * dy;
    }
    return std::atan2(2.0 * cov_xy, cov_xx);
}

// Signed turning angle at each interior point
std::vector<double> Curvatures(const std::vector<StrokePoint>& points) {
    std::vector<double> curvatures;
    for (size_t i = 1; i + 1 < points.size(); i++) {
        double v1x = points[i].x - points[i - 1].x;
        double v1y = points[i].y - points[i - 1].y;
        double v2x = points[i + 1].x - points[i].x;
        double v2y = points[i + 1].y - points[i].y;
        double cross = v1x * v2y - v1y * v2x;
        double dot = v1x * v2x + v1y * v2y;
        curvatures.push_back(std::atan2(cross, dot));
    }
    return curvatures;
}

void ExtractGeometric(const std::vector<StrokePoint>& points, StrokeVector& f) {
    std::vector<double> xs, ys;
    xs.reserve(points.size());
    ys.reserve(points.size());
    for (const StrokePoint& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    Bounds bounds = BoundsNormalizer::calculate_bounds(points);
    double mean_x = Mean(xs);
    double mean_y = Mean(ys);
    double area = bounds.width * bounds.height;
    double perimeter = Perimeter(points);

    f.set(StrokeFeature::MEAN_X, mean_x);
    f.set(StrokeFeature::MEAN_Y, mean_y);
    f.set(StrokeFeature::WIDTH, bounds.width);
    f.set(StrokeFeature::HEIGHT, bounds.height);
    f.set(StrokeFeature::ASPECT_RATIO, bounds.height > 0.0 ? bounds.width / bounds.height : 0.0);
    f.set(StrokeFeature::AREA, area);
    f.set(StrokeFeature::PERIMETER, perimeter);
    f.set(StrokeFeature::COMPACTNESS, perimeter > 0.0 ? 4.0 * PI * area / (perimeter * perimeter) : 0.0);
    f.set(StrokeFeature::ELONGATION, Elongation(points, mean_x, mean_y));
    f.set(StrokeFeature::ORIENTATION, Orientation(points, mean_x, mean_y));
}

void ExtractStatistical(const std::vector<StrokePoint>& points, StrokeVector& f) {
    std::vector<double> xs, ys;
    for (const StrokePoint& p : points) {
        xs.push_back(p.x);
        ys.push_back(p.y);
    }

    f.set(StrokeFeature::X_VARIANCE, Variance(xs));
    f.set(StrokeFeature::Y_VARIANCE, Variance(ys));
    f.set(StrokeFeature::X_SKEWNESS, Skewness(xs));
    f.set(StrokeFeature::Y_SKEWNESS, Skewness(ys));
    f.set(StrokeFeature::X_KURTOSIS, Kurtosis(xs));
    f.set(StrokeFeature::Y_KURTOSIS, Kurtosis(ys));

    double perimeter = f.get(StrokeFeature::PERIMETER);
    f.set(StrokeFeature::POINT_DENSITY, perimeter > 0.0 ? points.size() / perimeter : 0.0);

    std::vector<double> curvatures = Curvatures(points);
    f.set(StrokeFeature::CURVATURE_MEAN, Mean(curvatures));
    f.set(StrokeFeature::CURVATURE_STD, StdDev(curvatures));
    f.set(StrokeFeature::CORNER_COUNT,
          std::count_if(curvatures.begin(), curvatures.end(),
                        [](double c) { return std::abs(c) > CORNER_THRESHOLD_RADIANS; }));
}

void ExtractDynamic(const std::vector<StrokePoint>& points, StrokeVector& f) {
    std::vector<double> velocities;
    for (size_t i = 1; i < points.size(); i++) {
        const StrokePoint& prev = points[i - 1];
        const StrokePoint& cur = points[i];
        double dt = (cur.timestamp && prev.timestamp)
            ? (*cur.timestamp - *prev.timestamp) / 1000.0
            : DEFAULT_FRAME_SECONDS;
        double dist = std::hypot(cur.x - prev.x, cur.y - prev.y);
        velocities.push_back(dt > 0.0 ? dist / dt : 0.0);
    }

    double max_velocity = 0.0;
    for (double v : velocities) max_velocity = std::max(max_velocity, v);
    f.set(StrokeFeature::AVG_VELOCITY, Mean(velocities));
    f.set(StrokeFeature::MAX_VELOCITY, max_velocity);

    // Consecutive velocity deltas over an assumed constant frame time
    std::vector<double> accelerations;
    double max_acceleration = 0.0;
    for (size_t i = 1; i < velocities.size(); i++) {
        double a = (velocities[i] - velocities[i - 1]) / DEFAULT_FRAME_SECONDS;
        accelerations.push_back(a);
        max_acceleration = std::max(max_acceleration, std::abs(a));
    }
    f.set(StrokeFeature::AVG_ACCELERATION, Mean(accelerations));
    f.set(StrokeFeature::MAX_ACCELERATION, max_acceleration);

    std::vector<double> pressures, tilts, twists;
    for (const StrokePoint& p : points) {
        pressures.push_back(p.pressure.value_or(DEFAULT_PRESSURE));
        tilts.push_back(p.tilt_x.value_or(0.0) + p.tilt_y.value_or(0.0));
        twists.push_back(p.twist.value_or(0.0));
    }
    f.set(StrokeFeature::PRESSURE_MEAN, Mean(pressures));
    f.set(StrokeFeature::PRESSURE_STD, StdDev(pressures));
    f.set(StrokeFeature::TILT_MEAN, Mean(tilts));
    f.set(StrokeFeature::TWIST_MEAN, Mean(twists));

    double first_time = points.front().timestamp.value_or(0.0);
    double last_time = points.back().timestamp.value_or(0.0);
    f.set(StrokeFeature::DURATION, (last_time - first_time) / 1000.0);

    int pause_count = 0;
    for (size_t i = 1; i < points.size(); i++) {
        if (points[i].timestamp && points[i - 1].timestamp) {
            double dt = (*points[i].timestamp - *points[i - 1].timestamp) / 1000.0;
            if (dt > PAUSE_THRESHOLD_SECONDS) {
                pause_count++;
            }
        }
    }
    f.set(StrokeFeature::PAUSE_COUNT, pause_count);
}

} // namespace

StrokeEncoder::StrokeEncoder(const DNAConfig& config)
    : normalizer_(config.reference_width, config.reference_height) {}

StrokeDNA StrokeEncoder::encode(const StrokeInput& input, const ArtistContext* context) const {
    double start = GetSteadyMillis();

    if (input.points.empty()) {
        throw InvalidInput(CErrorFormatter::InputError("stroke " + input.stroke_id, "has no points"));
    }

    // Throws InvalidInput on a degenerate canvas
    BoundsNormalizer::NormalizedStroke normalized =
        normalizer_.normalize_stroke(input.points, input.canvas_width, input.canvas_height);

    StrokeDNA dna;
    ExtractGeometric(normalized.points, dna.features);
    ExtractStatistical(normalized.points, dna.features);
    ExtractDynamic(input.points, dna.features);

    if (!dna.features.is_finite()) {
        LogPrintEncoder(WARN, "Stroke %s produced non-finite features, zeroing them",
                        input.stroke_id.c_str());
        for (float& v : dna.features) {
            if (!std::isfinite(v)) v = 0.0f;
        }
    }

    dna.dna_id = GenerateDNAId("stroke");
    dna.stroke_id = input.stroke_id;
    if (!input.session_id.empty()) {
        dna.session_id = input.session_id;
    } else if (context != nullptr) {
        dna.session_id = context->session_id;
    } else {
        dna.session_id = "unknown";
    }

    StrokeBounds bounds;
    bounds.x = normalized.bounds.normalized.x;
    bounds.y = normalized.bounds.normalized.y;
    bounds.width = normalized.bounds.normalized.width;
    bounds.height = normalized.bounds.normalized.height;
    bounds.scale_factor = normalized.bounds.scale_factor;
    dna.normalized_bounds = bounds;

    dna.tool = input.tool;
    dna.color = input.color;
    dna.timestamp = GetTimeMillis();
    dna.encoding_time_ms = std::max(0.0, GetSteadyMillis() - start);
    return dna;
}

} // namespace art_dna
