// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_UTIL_STRENCODINGS_H
#define TALLY_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Hex encoding used for diagnostics (scripts, keys, hashes in log lines)
 */
std::string HexStr(const uint8_t* data, size_t len);
std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to bytes. Returns an empty vector on any
 * non-hex character or odd length.
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is valid, even-length hexadecimal
 */
bool IsHex(const std::string& str);

/**
 * Split on a separator, trimming blanks and dropping empty items
 */
std::vector<std::string> SplitString(const std::string& str, char sep);

/**
 * ASCII lowercase copy
 */
std::string ToLower(const std::string& str);

/**
 * Convert single hex character to its numeric value
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

#endif // TALLY_UTIL_STRENCODINGS_H
