// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_COLOR_UTILS_H
#define ARTDNA_COLOR_UTILS_H

#include <cstdint>
#include <optional>
#include <string>

namespace art_dna {

struct RGBColor {
    int r = 0;
    int g = 0;
    int b = 0;
};

/** Hue in degrees [0, 360), saturation and value in [0, 1] */
struct HSVColor {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

/**
 * Parse "#rrggbb" or "rrggbb" (case-insensitive).
 * @return nullopt for anything else, including named colors and "#rgb"
 */
std::optional<RGBColor> ParseHexColor(const std::string& hex);

/** Channels are clamped to [0, 255]; output is lowercase "#rrggbb" */
std::string ToHexColor(int r, int g, int b);

HSVColor RgbToHsv(const RGBColor& rgb);

} // namespace art_dna

#endif // ARTDNA_COLOR_UTILS_H
