// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <wallet/keystore.h>
#include <util/logging.h>

bool CBasicKeyStore::AddPubKey(const CPubKey& pubkey)
{
    if (!pubkey.IsValid()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_keystore);

    if (!setKeys.insert(pubkey).second) {
        return false;
    }

    mapKeyHashes[pubkey.GetID()] = pubkey;
    mapKeyHashes[pubkey.GetUncompressedID()] = pubkey;

    LogPrintWallet(DEBUG, "Keystore: added key %s", pubkey.GetAddress().c_str());
    return true;
}

bool CBasicKeyStore::RemovePubKey(const CPubKey& pubkey)
{
    std::lock_guard<std::mutex> lock(cs_keystore);

    if (setKeys.erase(pubkey) == 0) {
        return false;
    }

    mapKeyHashes.erase(pubkey.GetID());
    mapKeyHashes.erase(pubkey.GetUncompressedID());
    return true;
}

bool CBasicKeyStore::HaveKey(const CPubKey& pubkey) const
{
    std::lock_guard<std::mutex> lock(cs_keystore);
    return setKeys.count(pubkey) > 0;
}

bool CBasicKeyStore::GetPubKeyByHash(const std::vector<uint8_t>& hash160, CPubKey& pubkey) const
{
    std::lock_guard<std::mutex> lock(cs_keystore);

    auto it = mapKeyHashes.find(hash160);
    if (it == mapKeyHashes.end()) {
        return false;
    }

    pubkey = it->second;
    return true;
}

std::vector<CPubKey> CBasicKeyStore::GetPubKeys() const
{
    std::lock_guard<std::mutex> lock(cs_keystore);
    return std::vector<CPubKey>(setKeys.begin(), setKeys.end());
}

size_t CBasicKeyStore::Size() const
{
    std::lock_guard<std::mutex> lock(cs_keystore);
    return setKeys.size();
}
