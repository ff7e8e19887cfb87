// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/image_encoder.h>

#include <art_dna/color_utils.h>
#include <art_dna/seeded_rng.h>
#include <art_dna/stats.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <util/time.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace art_dna {

namespace {

static const size_t COLOR_SAMPLE_RATE = 10;
static const int KMEANS_ITERATIONS = 5;
static const double PLACEHOLDER_SCALE = 0.1;

using Pixel = std::array<double, 3>;

void ValidateSnapshot(const CanvasSnapshot& snapshot) {
    if (snapshot.width < 2 || snapshot.height < 2) {
        throw InvalidInput(CErrorFormatter::InputError("snapshot " + snapshot.snapshot_id,
            strprintf("must be at least 2x2, got %dx%d", snapshot.width, snapshot.height)));
    }
    size_t expected = static_cast<size_t>(snapshot.width) * static_cast<size_t>(snapshot.height) * 4;
    if (snapshot.rgba.size() != expected) {
        throw InvalidInput(CErrorFormatter::InputError("snapshot " + snapshot.snapshot_id,
            strprintf("has %zu bytes, expected %zu", snapshot.rgba.size(), expected)));
    }
}

// Row-major gray plane, (r + g + b) / 3
std::vector<double> GrayPlane(const CanvasSnapshot& snapshot) {
    size_t pixels = snapshot.rgba.size() / 4;
    std::vector<double> gray(pixels);
    for (size_t i = 0; i < pixels; i++) {
        const uint8_t* p = &snapshot.rgba[i * 4];
        gray[i] = (p[0] + p[1] + p[2]) / 3.0;
    }
    return gray;
}

void FillPlaceholders(ImageVector& features, size_t begin, size_t end, SeededRNG& rng) {
    for (size_t i = begin; i < end; i++) {
        features[i] = static_cast<float>(rng.next() * PLACEHOLDER_SCALE);
    }
}

// Block 1: edge strength
void ExtractLowLevel(const std::vector<double>& gray, int width, int height, ImageVector& features) {
    double horizontal = 0.0;
    for (int y = 0; y < height - 1; y++) {
        for (int x = 0; x < width; x++) {
            horizontal += std::abs(gray[(y + 1) * width + x] - gray[y * width + x]);
        }
    }
    features.set(ImageFeature::EDGE_HORIZONTAL, horizontal / (static_cast<double>(width) * (height - 1)));

    double vertical = 0.0;
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width - 1; x++) {
            vertical += std::abs(gray[y * width + x + 1] - gray[y * width + x]);
        }
    }
    features.set(ImageFeature::EDGE_VERTICAL, vertical / (static_cast<double>(width - 1) * height));
}

// Block 2: gradient orientation histogram weighted by magnitude
void ExtractEdgeOrientation(const std::vector<double>& gray, int width, int height, ImageVector& features) {
    std::array<double, ORIENTATION_BINS> bins{};
    for (int y = 1; y < height - 1; y++) {
        for (int x = 1; x < width - 1; x++) {
            double gx = gray[y * width + x + 1] - gray[y * width + x - 1];
            double gy = gray[(y + 1) * width + x] - gray[(y - 1) * width + x];
            double magnitude = std::sqrt(gx * gx + gy * gy);
            double angle = std::atan2(gy, gx);
            size_t bin = static_cast<size_t>(std::floor((angle + PI) / (2.0 * PI) * ORIENTATION_BINS)) % ORIENTATION_BINS;
            bins[bin] += magnitude;
        }
    }

    double max_value = *std::max_element(bins.begin(), bins.end());
    size_t offset = static_cast<size_t>(ImageFeature::ORIENTATION_HISTOGRAM);
    for (size_t i = 0; i < ORIENTATION_BINS; i++) {
        features[offset + i] = static_cast<float>(max_value > 0.0 ? bins[i] / max_value : 0.0);
    }
}

// Block 3: per-channel histograms, each sums to 1
void ExtractColorHistograms(const CanvasSnapshot& snapshot, ImageVector& features) {
    std::array<std::array<double, COLOR_HISTOGRAM_BINS>, 3> hist{};
    size_t pixels = snapshot.rgba.size() / 4;
    for (size_t i = 0; i < pixels; i++) {
        for (size_t c = 0; c < 3; c++) {
            size_t bin = static_cast<size_t>(std::floor(snapshot.rgba[i * 4 + c] / 255.0 * 15.0));
            hist[c][bin] += 1.0;
        }
    }

    size_t offset = static_cast<size_t>(ImageFeature::RGB_HISTOGRAM);
    for (size_t c = 0; c < 3; c++) {
        for (size_t i = 0; i < COLOR_HISTOGRAM_BINS; i++) {
            features[offset + c * COLOR_HISTOGRAM_BINS + i] = static_cast<float>(hist[c][i] / pixels);
        }
    }
}

double ColorDistance(const Pixel& a, const Pixel& b) {
    double dr = a[0] - b[0];
    double dg = a[1] - b[1];
    double db = a[2] - b[2];
    return std::sqrt(dr * dr + dg * dg + db * db);
}

std::vector<Pixel> KMeans(const std::vector<Pixel>& pixels, size_t k, SeededRNG& rng) {
    std::vector<Pixel> centroids;
    for (size_t i = 0; i < k; i++) {
        centroids.push_back(rng.choice(pixels));
    }

    for (int iter = 0; iter < KMEANS_ITERATIONS; iter++) {
        std::vector<Pixel> sums(k, Pixel{0.0, 0.0, 0.0});
        std::vector<size_t> counts(k, 0);

        for (const Pixel& pixel : pixels) {
            double min_dist = std::numeric_limits<double>::infinity();
            size_t min_cluster = 0;
            for (size_t c = 0; c < k; c++) {
                double dist = ColorDistance(pixel, centroids[c]);
                if (dist < min_dist) {
                    min_dist = dist;
                    min_cluster = c;
                }
            }
            for (size_t ch = 0; ch < 3; ch++) sums[min_cluster][ch] += pixel[ch];
            counts[min_cluster]++;
        }

        for (size_t c = 0; c < k; c++) {
            if (counts[c] > 0) {
                for (size_t ch = 0; ch < 3; ch++) {
                    centroids[c][ch] = std::round(sums[c][ch] / counts[c]);
                }
            }
        }
    }

    return centroids;
}

} // namespace

ImageEncoder::ImageEncoder(const DNAConfig& config)
    : seed_(config.image_seed) {}

std::future<ImageDNA> ImageEncoder::encode(const CanvasSnapshot& snapshot, const std::string& session_id) const {
    return std::async(std::launch::async, [encoder = *this, snapshot, session_id]() {
        return encoder.encode_in_worker(snapshot, session_id);
    });
}

ImageDNA ImageEncoder::encode_sync(const CanvasSnapshot&, const std::string&) const {
    throw std::logic_error("ImageDNA encoding must be async (use encode() or the worker pool)");
}

ImageDNA ImageEncoder::encode_in_worker(const CanvasSnapshot& snapshot, const std::string& session_id) const {
    double start = GetSteadyMillis();
    ValidateSnapshot(snapshot);

    SeededRNG rng(seed_);
    std::vector<double> gray = GrayPlane(snapshot);

    ImageDNA dna;
    ExtractLowLevel(gray, snapshot.width, snapshot.height, dna.features);
    FillPlaceholders(dna.features, 2, IMAGE_BLOCK_SIZE_SMALL, rng);
    ExtractEdgeOrientation(gray, snapshot.width, snapshot.height, dna.features);
    ExtractColorHistograms(snapshot, dna.features);
    FillPlaceholders(dna.features, static_cast<size_t>(ImageFeature::PATTERN_SLOTS),
                     static_cast<size_t>(ImageFeature::STRUCTURE_BAND), rng);
    FillPlaceholders(dna.features, static_cast<size_t>(ImageFeature::STRUCTURE_BAND),
                     static_cast<size_t>(ImageFeature::SEMANTIC_BAND), rng);
    FillPlaceholders(dna.features, static_cast<size_t>(ImageFeature::SEMANTIC_BAND), IMAGE_DIMENSIONS, rng);

    dna.dominant_colors = extract_dominant_colors(snapshot);
    dna.texture = extract_texture(snapshot);

    dna.dna_id = GenerateDNAId("image");
    dna.session_id = session_id.empty() ? "unknown" : session_id;
    dna.snapshot_id = snapshot.snapshot_id.empty() ? GenerateDNAId("snapshot") : snapshot.snapshot_id;
    dna.width = snapshot.width;
    dna.height = snapshot.height;
    dna.timestamp = GetTimeMillis();
    dna.encoding_time_ms = std::max(0.0, GetSteadyMillis() - start);

    LogPrintEncoder(DEBUG, "Image DNA %s encoded in %.2fms (%dx%d, %zu colors)",
                    dna.dna_id.c_str(), dna.encoding_time_ms, dna.width, dna.height,
                    dna.dominant_colors.size());
    return dna;
}

std::vector<std::string> ImageEncoder::extract_dominant_colors(const CanvasSnapshot& snapshot, size_t k) const {
    ValidateSnapshot(snapshot);

    std::vector<Pixel> pixels;
    for (size_t i = 0; i < snapshot.rgba.size(); i += 4 * COLOR_SAMPLE_RATE) {
        pixels.push_back(Pixel{static_cast<double>(snapshot.rgba[i]),
                               static_cast<double>(snapshot.rgba[i + 1]),
                               static_cast<double>(snapshot.rgba[i + 2])});
    }

    // Separate stream from the placeholder slots
    SeededRNG rng = SeededRNG(seed_).derive(1);
    std::vector<std::string> colors;
    for (const Pixel& c : KMeans(pixels, k, rng)) {
        std::string hex = ToHexColor(static_cast<int>(c[0]), static_cast<int>(c[1]), static_cast<int>(c[2]));
        // Centroids seeded from the same pixel collapse to one color
        if (std::find(colors.begin(), colors.end(), hex) == colors.end()) {
            colors.push_back(hex);
        }
    }
    return colors;
}

TextureFeatures ImageEncoder::extract_texture(const CanvasSnapshot& snapshot) {
    ValidateSnapshot(snapshot);

    int width = snapshot.width;
    int height = snapshot.height;
    std::vector<double> gray = GrayPlane(snapshot);

    TextureFeatures texture;

    double edges = 0.0;
    for (int y = 0; y < height - 1; y++) {
        for (int x = 0; x < width - 1; x++) {
            double g = gray[y * width + x];
            edges += std::abs(gray[y * width + x + 1] - g) + std::abs(gray[(y + 1) * width + x] - g);
        }
    }
    texture.complexity = edges / (static_cast<double>(width - 1) * (height - 1) * 255.0 * 2.0);

    auto range = std::minmax_element(gray.begin(), gray.end());
    texture.contrast = (*range.second - *range.first) / 255.0;

    std::array<double, 256> histogram{};
    for (double g : gray) {
        histogram[static_cast<size_t>(std::floor(g))] += 1.0;
    }
    for (double count : histogram) {
        double p = count / gray.size();
        texture.energy += p * p;
    }

    return texture;
}

} // namespace art_dna
