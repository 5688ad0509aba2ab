// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <script/script.h>

const char* GetCoinTypeName(CoinType type) {
    switch (type) {
        case CoinType::PUBKEYHASH: return "pubkeyhash";
        case CoinType::PUBKEY: return "pubkey";
    }
    return "unknown";
}

std::vector<uint8_t> BuildPayToPubKeyHash(const std::vector<uint8_t>& hash160) {
    std::vector<uint8_t> script;
    script.reserve(5 + hash160.size());
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(static_cast<uint8_t>(hash160.size()));
    script.insert(script.end(), hash160.begin(), hash160.end());
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    return script;
}

std::vector<uint8_t> BuildPayToPubKey(const std::vector<uint8_t>& pubkey) {
    std::vector<uint8_t> script;
    script.reserve(2 + pubkey.size());
    script.push_back(static_cast<uint8_t>(pubkey.size()));
    script.insert(script.end(), pubkey.begin(), pubkey.end());
    script.push_back(OP_CHECKSIG);
    return script;
}

std::vector<uint8_t> BuildScriptSig(const std::vector<uint8_t>& r,
                                    const std::vector<uint8_t>& s,
                                    const std::vector<uint8_t>& pubkey,
                                    uint8_t hashType) {
    std::vector<uint8_t> der;
    der.push_back(DER_SEQUENCE_MARKER);
    der.push_back(static_cast<uint8_t>(4 + r.size() + s.size()));
    der.push_back(DER_INTEGER_MARKER);
    der.push_back(static_cast<uint8_t>(r.size()));
    der.insert(der.end(), r.begin(), r.end());
    der.push_back(DER_INTEGER_MARKER);
    der.push_back(static_cast<uint8_t>(s.size()));
    der.insert(der.end(), s.begin(), s.end());

    std::vector<uint8_t> script;
    script.push_back(static_cast<uint8_t>(der.size() + 1));
    script.insert(script.end(), der.begin(), der.end());
    script.push_back(hashType);
    script.push_back(static_cast<uint8_t>(pubkey.size()));
    script.insert(script.end(), pubkey.begin(), pubkey.end());
    return script;
}
