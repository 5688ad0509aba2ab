// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_SCRIPT_MATCHER_H
#define TALLY_SCRIPT_MATCHER_H

#include <script/script.h>
#include <serialize.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * Script Template Matcher
 *
 * Strict, fail-closed decoders for the script forms the wallet recognizes.
 * No script is executed: a script either matches a template byte for byte
 * (fixed markers, length-prefixed fields, no trailing bytes) or it does not.
 * Partial matches are never returned.
 *
 * All functions are pure and safe to call from any thread.
 */

enum class ScriptMatchStatus {
    OK,
    DECODE_ERROR,        // Short buffer, wrong marker/opcode, trailing bytes
    UNSUPPORTED_FORMAT,  // Recognized but deliberately not handled (legacy scriptSig, other sighash)
};

const char* GetScriptMatchStatusName(ScriptMatchStatus status);

/** Pay-to-public-key-hash: OP_DUP OP_HASH160 0x14 <hash160> OP_EQUALVERIFY OP_CHECKSIG */
struct CPayToPubKeyHash {
    std::vector<uint8_t> vchHash;   // 20 bytes
};

/** Pay-to-public-key: <len> <pubkey> OP_CHECKSIG */
struct CPayToPubKey {
    std::vector<uint8_t> vchPubKey;
};

/** DER signature wrapper at the start of a signature script */
struct CScriptSigHeader {
    uint8_t nSigLength;
    uint8_t nSequenceMarker;
    uint8_t nRSLength;
    uint8_t nRMarker;
    std::vector<uint8_t> vchR;
    uint8_t nSMarker;
    std::vector<uint8_t> vchS;

    CScriptSigHeader()
        : nSigLength(0), nSequenceMarker(0), nRSLength(0), nRMarker(0), nSMarker(0) {}
};

/** Hash type and public key following the DER signature */
struct CScriptSigTail {
    uint8_t nHashType;
    std::vector<uint8_t> vchPubKey;

    CScriptSigTail() : nHashType(0) {}
};

/** Result of matching an output script against both templates */
struct COutputMatch {
    CoinType type;
    std::vector<uint8_t> vchData;   // Key hash for PUBKEYHASH, key bytes for PUBKEY

    COutputMatch() : type(CoinType::PUBKEYHASH) {}
};

/**
 * Decode a pay-to-public-key-hash output script.
 * Any opcode or length byte mismatch, short buffer, or trailing byte is a
 * DECODE_ERROR.
 */
ScriptMatchStatus DecodePayToPubKeyHash(const std::vector<uint8_t>& script,
                                        CPayToPubKeyHash& out,
                                        std::string* error = nullptr);

/**
 * Decode a pay-to-public-key output script. The key bytes are returned as-is;
 * whether they form a valid point is the caller's concern.
 */
ScriptMatchStatus DecodePayToPubKey(const std::vector<uint8_t>& script,
                                    CPayToPubKey& out,
                                    std::string* error = nullptr);

/**
 * Decode the DER header of a signature script.
 *
 * Returns UNSUPPORTED_FORMAT when the header decodes and nothing follows it
 * (old signature scripts without an embedded key). Marker bytes other than
 * 0x30 / 0x02 / 0x02 are a DECODE_ERROR. On OK the reader is positioned at
 * the tail.
 */
ScriptMatchStatus DecodeScriptSigHeader(CDataReader& reader,
                                        CScriptSigHeader& out,
                                        std::string* error = nullptr);

/**
 * Decode the tail of a signature script, which must consume the rest of the
 * buffer. A hash type other than SIGHASH_ALL is UNSUPPORTED_FORMAT.
 */
ScriptMatchStatus DecodeScriptSigTail(CDataReader& reader,
                                      CScriptSigTail& out,
                                      std::string* error = nullptr);

/**
 * Header then tail over a whole signature script
 */
ScriptMatchStatus DecodeScriptSig(const std::vector<uint8_t>& script,
                                  CScriptSigHeader& header,
                                  CScriptSigTail& tail,
                                  std::string* error = nullptr);

/**
 * Try pay-to-public-key-hash first, then pay-to-public-key.
 * When both fail the error carries both messages.
 */
ScriptMatchStatus MatchOutputScript(const std::vector<uint8_t>& script,
                                    COutputMatch& out,
                                    std::string* error = nullptr);

#endif // TALLY_SCRIPT_MATCHER_H
