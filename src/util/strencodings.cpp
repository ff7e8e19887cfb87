// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <util/strencodings.h>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

std::string strprintf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);

    if (needed <= 0) {
        va_end(args);
        return std::string();
    }

    std::string result(static_cast<size_t>(needed) + 1, '\0');
    vsnprintf(&result[0], result.size(), format, args);
    va_end(args);
    result.resize(static_cast<size_t>(needed));
    return result;
}

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);
        result.push_back(hexmap[data[i] & 0x0F]);
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    if (!IsHex(str)) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> result;
    result.reserve(str.size() / 2);

    for (size_t i = 0; i < str.size(); i += 2) {
        int8_t high = HexDigit(str[i]);
        int8_t low = HexDigit(str[i + 1]);
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return result;
}

bool IsHex(const std::string& str) {
    if (str.empty() || str.size() % 2 != 0) {
        return false;
    }

    return std::all_of(str.begin(), str.end(), [](char c) { return HexDigit(c) >= 0; });
}

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}
