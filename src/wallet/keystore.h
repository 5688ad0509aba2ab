// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_WALLET_KEYSTORE_H
#define TALLY_WALLET_KEYSTORE_H

#include <pubkey.h>

#include <map>
#include <mutex>
#include <set>
#include <vector>

/**
 * Key ownership registry as seen by the transaction processor.
 *
 * Implementations must keep GetPubKeyByHash consistent with HaveKey: a hash
 * resolves to a key exactly when that key is owned.
 */
class CKeyStore
{
public:
    virtual ~CKeyStore() = default;

    //! True if the key belongs to this wallet
    virtual bool HaveKey(const CPubKey& pubkey) const = 0;

    /**
     * Reverse lookup of a 20-byte key hash (as found in pay-to-public-key-hash
     * scripts) to an owned public key
     * @param hash160 Key hash
     * @param[out] pubkey The owned key, if found
     * @return true if the hash belongs to an owned key
     */
    virtual bool GetPubKeyByHash(const std::vector<uint8_t>& hash160, CPubKey& pubkey) const = 0;
};

/**
 * In-memory keystore
 *
 * Every key is indexed under the HASH160 of both its compressed and its
 * uncompressed encoding, so scripts built by either kind of wallet resolve
 * to the same owned key.
 *
 * Thread Safety: all methods lock cs_keystore.
 */
class CBasicKeyStore : public CKeyStore
{
private:
    mutable std::mutex cs_keystore;

    std::set<CPubKey> setKeys;

    // hash160 -> key, both encodings
    std::map<std::vector<uint8_t>, CPubKey> mapKeyHashes;

public:
    CBasicKeyStore() = default;

    /**
     * Add a key to the store
     * @return false if the key is invalid or already present
     */
    bool AddPubKey(const CPubKey& pubkey);

    /**
     * Remove a key and its hash index entries
     * @return false if the key was not present
     */
    bool RemovePubKey(const CPubKey& pubkey);

    bool HaveKey(const CPubKey& pubkey) const override;
    bool GetPubKeyByHash(const std::vector<uint8_t>& hash160, CPubKey& pubkey) const override;

    std::vector<CPubKey> GetPubKeys() const;
    size_t Size() const;
};

#endif // TALLY_WALLET_KEYSTORE_H
