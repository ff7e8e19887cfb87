// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/color_utils.h>

#include <util/strencodings.h>

#include <algorithm>
#include <cmath>

namespace art_dna {

std::optional<RGBColor> ParseHexColor(const std::string& hex) {
    std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (digits.size() != 6) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = ParseHex(digits);
    if (bytes.size() != 3) {
        return std::nullopt;
    }
    RGBColor color;
    color.r = bytes[0];
    color.g = bytes[1];
    color.b = bytes[2];
    return color;
}

std::string ToHexColor(int r, int g, int b) {
    uint8_t bytes[3] = {
        static_cast<uint8_t>(std::min(255, std::max(0, r))),
        static_cast<uint8_t>(std::min(255, std::max(0, g))),
        static_cast<uint8_t>(std::min(255, std::max(0, b))),
    };
    return "#" + HexStr(bytes, 3);
}

HSVColor RgbToHsv(const RGBColor& rgb) {
    double r = rgb.r / 255.0;
    double g = rgb.g / 255.0;
    double b = rgb.b / 255.0;

    double max = std::max({r, g, b});
    double min = std::min({r, g, b});
    double delta = max - min;

    HSVColor hsv;
    if (delta > 0.0) {
        if (max == r) {
            hsv.h = 60.0 * std::fmod((g - b) / delta, 6.0);
        } else if (max == g) {
            hsv.h = 60.0 * ((b - r) / delta + 2.0);
        } else {
            hsv.h = 60.0 * ((r - g) / delta + 4.0);
        }
    }
    if (hsv.h < 0.0) {
        hsv.h += 360.0;
    }
    hsv.s = max == 0.0 ? 0.0 : delta / max;
    hsv.v = max;
    return hsv;
}

} // namespace art_dna
