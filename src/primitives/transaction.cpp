// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <primitives/transaction.h>
#include <crypto/hash.h>
#include <serialize.h>
#include <stdexcept>

const uint32_t COutPoint::NULL_INDEX;
const uint32_t CTxIn::SEQUENCE_FINAL;

// Sanity limits applied while decoding untrusted data
static const uint64_t MAX_TX_INPUTS = 100000;
static const uint64_t MAX_TX_OUTPUTS = 100000;
static const uint64_t MAX_SCRIPT_SIZE = 10000;

// Smallest encodings: prevout(36) + empty script(1) + sequence(4), value(8) + empty script(1)
static const size_t MIN_TX_INPUT_SIZE = 41;
static const size_t MIN_TX_OUTPUT_SIZE = 9;

std::vector<uint8_t> CTransaction::Serialize() const {
    std::vector<uint8_t> data;
    data.reserve(GetSerializedSize());

    WriteUint32LE(data, static_cast<uint32_t>(nVersion));

    WriteCompactSize(data, vin.size());
    for (const CTxIn& txin : vin) {
        data.insert(data.end(), txin.prevout.hash.begin(), txin.prevout.hash.end());
        WriteUint32LE(data, txin.prevout.n);
        WriteCompactSize(data, txin.scriptSig.size());
        data.insert(data.end(), txin.scriptSig.begin(), txin.scriptSig.end());
        WriteUint32LE(data, txin.nSequence);
    }

    WriteCompactSize(data, vout.size());
    for (const CTxOut& txout : vout) {
        WriteUint64LE(data, txout.nValue);
        WriteCompactSize(data, txout.scriptPubKey.size());
        data.insert(data.end(), txout.scriptPubKey.begin(), txout.scriptPubKey.end());
    }

    WriteUint32LE(data, nLockTime);

    return data;
}

uint256 CTransaction::GetHash() const {
    return Hash256(Serialize());
}

size_t CTransaction::GetSerializedSize() const {
    size_t size = 4 + GetCompactSizeLength(vin.size());
    for (const CTxIn& txin : vin) {
        size += 32 + 4 + GetCompactSizeLength(txin.scriptSig.size()) + txin.scriptSig.size() + 4;
    }

    size += GetCompactSizeLength(vout.size());
    for (const CTxOut& txout : vout) {
        size += 8 + GetCompactSizeLength(txout.scriptPubKey.size()) + txout.scriptPubKey.size();
    }

    return size + 4;
}

uint64_t CTransaction::GetValueOut() const {
    uint64_t total = 0;
    for (const CTxOut& txout : vout) {
        if (txout.nValue > UINT64_MAX - total) {
            throw std::runtime_error("CTransaction::GetValueOut(): value out of range");
        }
        total += txout.nValue;
    }
    return total;
}

static bool Fail(std::string* error, const char* message) {
    if (error) *error = message;
    return false;
}

static bool ReadScript(CDataReader& reader, std::vector<uint8_t>& script, const char* what, std::string* error) {
    uint64_t len;
    if (!reader.ReadCompactSize(len)) {
        if (error) *error = std::string("Insufficient data for ") + what + " length";
        return false;
    }
    if (len > MAX_SCRIPT_SIZE) {
        if (error) *error = std::string(what) + " too large";
        return false;
    }
    if (!reader.ReadBytes(static_cast<size_t>(len), script)) {
        if (error) *error = std::string("Insufficient data for ") + what;
        return false;
    }
    return true;
}

bool CTransaction::Deserialize(const uint8_t* data, size_t len, std::string* error, size_t* bytesConsumed) {
    nVersion = 1;
    vin.clear();
    vout.clear();
    nLockTime = 0;

    CDataReader reader(data, len);

    uint32_t version;
    if (!reader.ReadUint32LE(version)) {
        return Fail(error, "Insufficient data for version");
    }
    nVersion = static_cast<int32_t>(version);

    uint64_t vin_count;
    if (!reader.ReadCompactSize(vin_count)) {
        return Fail(error, "Insufficient data for input count");
    }
    if (vin_count > MAX_TX_INPUTS) {
        return Fail(error, "Too many inputs");
    }
    // Refuse to allocate for counts the remaining bytes cannot back
    if (vin_count * MIN_TX_INPUT_SIZE > reader.Remaining()) {
        return Fail(error, "Transaction claims more inputs than data available");
    }

    vin.resize(vin_count);
    for (CTxIn& txin : vin) {
        if (!reader.ReadBytes(32, txin.prevout.hash.data)) {
            return Fail(error, "Insufficient data for prevout hash");
        }
        if (!reader.ReadUint32LE(txin.prevout.n)) {
            return Fail(error, "Insufficient data for prevout index");
        }
        if (!ReadScript(reader, txin.scriptSig, "scriptSig", error)) {
            return false;
        }
        if (!reader.ReadUint32LE(txin.nSequence)) {
            return Fail(error, "Insufficient data for sequence");
        }
    }

    uint64_t vout_count;
    if (!reader.ReadCompactSize(vout_count)) {
        return Fail(error, "Insufficient data for output count");
    }
    if (vout_count > MAX_TX_OUTPUTS) {
        return Fail(error, "Too many outputs");
    }
    if (vout_count * MIN_TX_OUTPUT_SIZE > reader.Remaining()) {
        return Fail(error, "Transaction claims more outputs than data available");
    }

    vout.resize(vout_count);
    for (CTxOut& txout : vout) {
        if (!reader.ReadUint64LE(txout.nValue)) {
            return Fail(error, "Insufficient data for output value");
        }
        if (!ReadScript(reader, txout.scriptPubKey, "scriptPubKey", error)) {
            return false;
        }
    }

    if (!reader.ReadUint32LE(nLockTime)) {
        return Fail(error, "Insufficient data for locktime");
    }

    if (bytesConsumed) {
        *bytesConsumed = reader.Position();
    } else if (!reader.IsEmpty()) {
        return Fail(error, "Extra data after transaction");
    }

    return true;
}
