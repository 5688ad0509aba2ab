// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <crypto/hash.h>

#include <openssl/sha.h>
#include <openssl/ripemd.h>
#include <stdexcept>

void SHA256Hash(const uint8_t* data, size_t len, uint8_t hash[32]) {
    if (data == nullptr && len > 0) {
        throw std::invalid_argument("SHA256Hash: data is NULL but len > 0");
    }

    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    SHA256_Update(&ctx, data, len);
    SHA256_Final(hash, &ctx);
}

uint256 Hash256(const uint8_t* data, size_t len) {
    uint8_t first[32];
    SHA256Hash(data, len, first);

    uint256 result;
    SHA256Hash(first, sizeof(first), result.data);
    return result;
}

std::vector<uint8_t> Hash160(const uint8_t* data, size_t len) {
    uint8_t sha[32];
    SHA256Hash(data, len, sha);

    std::vector<uint8_t> result(RIPEMD160_DIGEST_LENGTH);
    RIPEMD160_CTX ctx;
    RIPEMD160_Init(&ctx);
    RIPEMD160_Update(&ctx, sha, sizeof(sha));
    RIPEMD160_Final(result.data(), &ctx);
    return result;
}
