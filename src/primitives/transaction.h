// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_PRIMITIVES_TRANSACTION_H
#define TALLY_PRIMITIVES_TRANSACTION_H

#include <uint256.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/** Reference to output n of transaction hash. */
class COutPoint {
public:
    uint256 hash;
    uint32_t n;

    static const uint32_t NULL_INDEX = 0xffffffff;

    COutPoint() : n(NULL_INDEX) {}
    COutPoint(const uint256& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    /** Zero hash with index 0xffffffff: the input of a coinbase. */
    bool IsNull() const { return hash.IsNull() && n == NULL_INDEX; }
    void SetNull() { hash = uint256(); n = NULL_INDEX; }

    bool operator==(const COutPoint& other) const { return hash == other.hash && n == other.n; }
    bool operator!=(const COutPoint& other) const { return !(*this == other); }
    bool operator<(const COutPoint& other) const {
        return hash == other.hash ? n < other.n : hash < other.hash;
    }
};

/** Transaction input: the coin it spends and the script unlocking it. */
class CTxIn {
public:
    COutPoint prevout;
    std::vector<uint8_t> scriptSig;
    uint32_t nSequence;

    static const uint32_t SEQUENCE_FINAL = 0xffffffff;

    CTxIn() : nSequence(SEQUENCE_FINAL) {}
    explicit CTxIn(const COutPoint& prevoutIn, const std::vector<uint8_t>& scriptSigIn = std::vector<uint8_t>())
        : prevout(prevoutIn), scriptSig(scriptSigIn), nSequence(SEQUENCE_FINAL) {}
    CTxIn(const uint256& hashPrevTx, uint32_t nOut, const std::vector<uint8_t>& scriptSigIn = std::vector<uint8_t>())
        : prevout(hashPrevTx, nOut), scriptSig(scriptSigIn), nSequence(SEQUENCE_FINAL) {}

    bool operator==(const CTxIn& other) const {
        return prevout == other.prevout && scriptSig == other.scriptSig && nSequence == other.nSequence;
    }
};

/** Transaction output: an amount and the script locking it. */
class CTxOut {
public:
    uint64_t nValue;
    std::vector<uint8_t> scriptPubKey;

    CTxOut() : nValue(0) {}
    CTxOut(uint64_t nValueIn, const std::vector<uint8_t>& scriptPubKeyIn)
        : nValue(nValueIn), scriptPubKey(scriptPubKeyIn) {}

    bool operator==(const CTxOut& other) const {
        return nValue == other.nValue && scriptPubKey == other.scriptPubKey;
    }
};

/**
 * A decoded wire transaction. The wallet core reads the prevouts and
 * signature scripts of the inputs, the values and locking scripts of the
 * outputs, and the transaction hash.
 *
 * Wire layout: version(4) | compact vin count | inputs | compact vout count |
 * outputs | locktime(4), integers little endian.
 */
class CTransaction {
public:
    int32_t nVersion;
    std::vector<CTxIn> vin;
    std::vector<CTxOut> vout;
    uint32_t nLockTime;

    CTransaction() : nVersion(1), nLockTime(0) {}

    /** Double SHA-256 of Serialize(). Recomputed on every call. */
    uint256 GetHash() const;

    size_t GetSerializedSize() const;

    /** Sum of output values; throws std::runtime_error on overflow. */
    uint64_t GetValueOut() const;

    /** Single input spending the null outpoint. */
    bool IsCoinBase() const { return vin.size() == 1 && vin[0].prevout.IsNull(); }

    std::vector<uint8_t> Serialize() const;

    /**
     * Decode a wire transaction, replacing the current contents.
     * @param data Serialized bytes
     * @param len Length of data
     * @param error Optional pointer to store error message
     * @param bytesConsumed If given, receives the encoded length and trailing
     *        bytes are allowed; otherwise trailing bytes are an error
     * @return true if successful
     */
    bool Deserialize(const uint8_t* data, size_t len, std::string* error = nullptr, size_t* bytesConsumed = nullptr);
};

#endif // TALLY_PRIMITIVES_TRANSACTION_H
