// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <script/matcher.h>
#include <util/logging.h>
#include <util/strencodings.h>

const char* GetScriptMatchStatusName(ScriptMatchStatus status) {
    switch (status) {
        case ScriptMatchStatus::OK: return "ok";
        case ScriptMatchStatus::DECODE_ERROR: return "decode error";
        case ScriptMatchStatus::UNSUPPORTED_FORMAT: return "unsupported format";
    }
    return "unknown";
}

static ScriptMatchStatus Reject(ScriptMatchStatus status, std::string* error, const std::string& message) {
    if (error) *error = message;
    return status;
}

static ScriptMatchStatus Reject(std::string* error, const std::string& message) {
    return Reject(ScriptMatchStatus::DECODE_ERROR, error, message);
}

static bool ExpectByte(CDataReader& reader, uint8_t expected, const char* name, std::string* error) {
    size_t pos = reader.Position();
    uint8_t value;
    if (!reader.ReadByte(value)) {
        if (error) *error = strprintf("script truncated before %s at byte %zu", name, pos);
        return false;
    }
    if (value != expected) {
        if (error) *error = strprintf("script byte %zu must be %s (0x%02x), got 0x%02x", pos, name, expected, value);
        return false;
    }
    return true;
}

ScriptMatchStatus DecodePayToPubKeyHash(const std::vector<uint8_t>& script,
                                        CPayToPubKeyHash& out,
                                        std::string* error) {
    CDataReader reader(script);

    if (!ExpectByte(reader, OP_DUP, "OP_DUP", error) ||
        !ExpectByte(reader, OP_HASH160, "OP_HASH160", error) ||
        !ExpectByte(reader, OP_PUSH20, "push-20", error)) {
        return ScriptMatchStatus::DECODE_ERROR;
    }

    std::vector<uint8_t> hash;
    if (!reader.ReadBytes(PUBKEY_HASH_SIZE, hash)) {
        return Reject(error, "script truncated inside 20-byte key hash");
    }

    if (!ExpectByte(reader, OP_EQUALVERIFY, "OP_EQUALVERIFY", error) ||
        !ExpectByte(reader, OP_CHECKSIG, "OP_CHECKSIG", error)) {
        return ScriptMatchStatus::DECODE_ERROR;
    }

    if (!reader.IsEmpty()) {
        return Reject(error, strprintf("pubkeyhash script has %zu trailing bytes", reader.Remaining()));
    }

    out.vchHash = hash;
    return ScriptMatchStatus::OK;
}

ScriptMatchStatus DecodePayToPubKey(const std::vector<uint8_t>& script,
                                    CPayToPubKey& out,
                                    std::string* error) {
    CDataReader reader(script);

    std::vector<uint8_t> pubkey;
    if (!reader.ReadVarBytes(pubkey)) {
        return Reject(error, "script truncated inside length-prefixed public key");
    }

    if (!ExpectByte(reader, OP_CHECKSIG, "OP_CHECKSIG", error)) {
        return ScriptMatchStatus::DECODE_ERROR;
    }

    if (!reader.IsEmpty()) {
        return Reject(error, strprintf("pubkey script has %zu trailing bytes", reader.Remaining()));
    }

    out.vchPubKey = pubkey;
    return ScriptMatchStatus::OK;
}

ScriptMatchStatus DecodeScriptSigHeader(CDataReader& reader,
                                        CScriptSigHeader& out,
                                        std::string* error) {
    CScriptSigHeader header;

    // Positional decode first; markers are checked once the shape is known
    if (!reader.ReadByte(header.nSigLength) ||
        !reader.ReadByte(header.nSequenceMarker) ||
        !reader.ReadByte(header.nRSLength) ||
        !reader.ReadByte(header.nRMarker) ||
        !reader.ReadVarBytes(header.vchR) ||
        !reader.ReadByte(header.nSMarker) ||
        !reader.ReadVarBytes(header.vchS)) {
        return Reject(error, "signature script too short for DER signature header");
    }

    if (reader.IsEmpty()) {
        LogPrintScript(DEBUG, "signature script of %zu bytes has no public key", reader.Position());
        return Reject(ScriptMatchStatus::UNSUPPORTED_FORMAT, error,
                      "old type of signature script (no public key), ignoring");
    }

    if (header.nSequenceMarker != DER_SEQUENCE_MARKER) {
        return Reject(error, strprintf("DER sequence marker must be 0x30, got 0x%02x", header.nSequenceMarker));
    }
    if (header.nRMarker != DER_INTEGER_MARKER) {
        return Reject(error, strprintf("DER R marker must be 0x02, got 0x%02x", header.nRMarker));
    }
    if (header.nSMarker != DER_INTEGER_MARKER) {
        return Reject(error, strprintf("DER S marker must be 0x02, got 0x%02x", header.nSMarker));
    }

    out = header;
    return ScriptMatchStatus::OK;
}

ScriptMatchStatus DecodeScriptSigTail(CDataReader& reader,
                                      CScriptSigTail& out,
                                      std::string* error) {
    CScriptSigTail tail;

    if (!reader.ReadByte(tail.nHashType) || !reader.ReadVarBytes(tail.vchPubKey)) {
        return Reject(error, "signature script truncated inside hash type / public key");
    }

    if (!reader.IsEmpty()) {
        return Reject(error, strprintf("signature script has %zu trailing bytes", reader.Remaining()));
    }

    if (tail.nHashType != SIGHASH_ALL) {
        LogPrintScript(DEBUG, "signature hash type 0x%02x not handled", tail.nHashType);
        return Reject(ScriptMatchStatus::UNSUPPORTED_FORMAT, error,
                      strprintf("unsupported signature hash type 0x%02x", tail.nHashType));
    }

    out = tail;
    return ScriptMatchStatus::OK;
}

ScriptMatchStatus DecodeScriptSig(const std::vector<uint8_t>& script,
                                  CScriptSigHeader& header,
                                  CScriptSigTail& tail,
                                  std::string* error) {
    CDataReader reader(script);

    ScriptMatchStatus status = DecodeScriptSigHeader(reader, header, error);
    if (status != ScriptMatchStatus::OK) {
        return status;
    }
    return DecodeScriptSigTail(reader, tail, error);
}

ScriptMatchStatus MatchOutputScript(const std::vector<uint8_t>& script,
                                    COutputMatch& out,
                                    std::string* error) {
    std::string errPubKeyHash;
    CPayToPubKeyHash p2pkh;
    if (DecodePayToPubKeyHash(script, p2pkh, &errPubKeyHash) == ScriptMatchStatus::OK) {
        out.type = CoinType::PUBKEYHASH;
        out.vchData = p2pkh.vchHash;
        return ScriptMatchStatus::OK;
    }

    std::string errPubKey;
    CPayToPubKey p2pk;
    if (DecodePayToPubKey(script, p2pk, &errPubKey) == ScriptMatchStatus::OK) {
        out.type = CoinType::PUBKEY;
        out.vchData = p2pk.vchPubKey;
        return ScriptMatchStatus::OK;
    }

    LogPrintScript(DEBUG, "output script %s matches no template", HexStr(script).c_str());
    return Reject(error, "unrecognized output script (pubkeyhash: " + errPubKeyHash +
                         "; pubkey: " + errPubKey + ")");
}
