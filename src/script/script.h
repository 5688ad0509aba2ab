// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_SCRIPT_SCRIPT_H
#define TALLY_SCRIPT_SCRIPT_H

#include <cstddef>
#include <cstdint>
#include <vector>

/** Script opcodes the template matcher knows about */
enum opcodetype : uint8_t {
    OP_PUSH20 = 0x14,
    OP_DUP = 0x76,
    OP_EQUALVERIFY = 0x88,
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,
};

/** DER envelope markers */
static const uint8_t DER_SEQUENCE_MARKER = 0x30;
static const uint8_t DER_INTEGER_MARKER = 0x02;

/** The only signature hash type accepted in signature scripts */
static const uint8_t SIGHASH_ALL = 0x01;

/** Size of the key hash carried by pay-to-public-key-hash scripts */
static const size_t PUBKEY_HASH_SIZE = 20;

/**
 * Output template ids. The numeric value is persisted with each coin.
 */
enum class CoinType : uint8_t {
    PUBKEYHASH = 0,
    PUBKEY = 1,
};

const char* GetCoinTypeName(CoinType type);

/**
 * Canonical encoders for the recognized script forms
 */
std::vector<uint8_t> BuildPayToPubKeyHash(const std::vector<uint8_t>& hash160);
std::vector<uint8_t> BuildPayToPubKey(const std::vector<uint8_t>& pubkey);

/**
 * Signature script: [len, 0x30, rsLen, 0x02, rLen, R, 0x02, sLen, S] [hashType, len, pubkey]
 * The leading length covers the DER body plus the hash type byte.
 */
std::vector<uint8_t> BuildScriptSig(const std::vector<uint8_t>& r,
                                    const std::vector<uint8_t>& s,
                                    const std::vector<uint8_t>& pubkey,
                                    uint8_t hashType = SIGHASH_ALL);

#endif // TALLY_SCRIPT_SCRIPT_H
