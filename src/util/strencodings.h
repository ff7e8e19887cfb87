// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_UTIL_STRENCODINGS_H
#define ARTDNA_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdint>

/**
 * printf-style formatting into a std::string (no length limit)
 */
std::string strprintf(const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/**
 * Hex String Encoding/Decoding Utilities
 *
 * Used for record ids, checksums and "#rrggbb" colors.
 */

/**
 * Convert byte array to lowercase hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to byte array
 * @return empty vector if str is not valid hex
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is non-empty, even-length hexadecimal
 */
bool IsHex(const std::string& str);

/**
 * Convert single hex character to its numeric value, -1 if not a hex digit
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string ToLower(const std::string& str);

#endif // ARTDNA_UTIL_STRENCODINGS_H
