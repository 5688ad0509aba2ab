// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_UTIL_BASE58_H
#define TALLY_UTIL_BASE58_H

#include <string>
#include <vector>
#include <cstdint>

// Base58 encoding/decoding functions
// Used for the human-readable address printed next to wallet diagnostics

/**
 * Encode data to Base58Check format (4-byte double SHA-256 checksum)
 * @param data The data to encode
 * @return Base58Check-encoded string
 */
std::string EncodeBase58Check(const std::vector<uint8_t>& data);

/**
 * Decode Base58Check format (with checksum verification)
 * @param str The Base58Check string to decode
 * @param data Output vector for decoded data (without checksum)
 * @return true if decoding and checksum verification succeeded, false otherwise
 */
bool DecodeBase58Check(const std::string& str, std::vector<uint8_t>& data);

std::string EncodeBase58(const std::vector<uint8_t>& data);
bool DecodeBase58(const std::string& str, std::vector<uint8_t>& data);

#endif // TALLY_UTIL_BASE58_H
