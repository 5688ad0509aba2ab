// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_CRYPTO_HASH_H
#define TALLY_CRYPTO_HASH_H

#include <uint256.h>

#include <stdint.h>
#include <stdlib.h>
#include <vector>

static const size_t HASH160_SIZE = 20;

/**
 * Bitcoin-style hashing on top of OpenSSL libcrypto
 *
 * Transaction ids are double SHA-256, public key ids (the 20-byte value
 * embedded in pay-to-public-key-hash scripts) are RIPEMD-160 of SHA-256.
 */

/**
 * Compute SHA-256 of data (one-shot function)
 *
 * @param data Input data to hash
 * @param len Length of input data in bytes
 * @param hash Output buffer for 32-byte hash
 */
void SHA256Hash(const uint8_t* data, size_t len, uint8_t hash[32]);

/**
 * Compute SHA-256(SHA-256(data))
 */
uint256 Hash256(const uint8_t* data, size_t len);

inline uint256 Hash256(const std::vector<uint8_t>& vch) {
    return Hash256(vch.data(), vch.size());
}

/**
 * Compute RIPEMD-160(SHA-256(data))
 *
 * @return 20-byte hash
 */
std::vector<uint8_t> Hash160(const uint8_t* data, size_t len);

inline std::vector<uint8_t> Hash160(const std::vector<uint8_t>& vch) {
    return Hash160(vch.data(), vch.size());
}

#endif // TALLY_CRYPTO_HASH_H
