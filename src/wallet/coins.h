// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_WALLET_COINS_H
#define TALLY_WALLET_COINS_H

#include <script/script.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * An owned, unspent output
 *
 * Snapshot of the output that created it: the owning key (compressed
 * public key bytes), the creating transaction and output position, the
 * value and the script template it was paid to.
 */
struct CCoin {
    std::vector<uint8_t> vchAddr;
    uint256 txid;
    uint32_t nIndex;
    uint64_t nValue;
    CoinType type;

    CCoin() : nIndex(0), nValue(0), type(CoinType::PUBKEYHASH) {}
    CCoin(const std::vector<uint8_t>& vchAddrIn, const uint256& txidIn, uint32_t nIndexIn,
          uint64_t nValueIn, CoinType typeIn)
        : vchAddr(vchAddrIn), txid(txidIn), nIndex(nIndexIn), nValue(nValueIn), type(typeIn) {}

    bool operator==(const CCoin& other) const {
        return vchAddr == other.vchAddr && txid == other.txid && nIndex == other.nIndex &&
               nValue == other.nValue && type == other.type;
    }

    /** Binary form used by the wallet database */
    std::vector<uint8_t> Serialize() const;
    bool Deserialize(const std::vector<uint8_t>& data, std::string* error = nullptr);

    std::string ToString() const;
};

/** Ascending by value, for coin selection */
struct CoinValueCompare {
    bool operator()(const CCoin& a, const CCoin& b) const { return a.nValue < b.nValue; }
};

/**
 * UTXO Registry
 *
 * Owned coins grouped by owning key. An address list is created by its
 * first coin and left in place (empty) when its last coin is removed.
 * Within a list no two coins share (txid, index); Add of a coin that is
 * already listed is a no-op, so rescanning a transaction is harmless.
 *
 * Thread Safety: one mutex (cs_coins) guards every list. Mutations are
 * synchronous; readers get copies.
 */
class CCoinRegistry
{
private:
    mutable std::mutex cs_coins;
    std::map<std::vector<uint8_t>, std::vector<CCoin>> mapCoins;

public:
    CCoinRegistry() = default;
    CCoinRegistry(const CCoinRegistry&) = delete;
    CCoinRegistry& operator=(const CCoinRegistry&) = delete;

    /**
     * Append a coin to the address's list.
     * @return false if (txid, nIndex) was already listed and nothing changed
     */
    bool Add(const std::vector<uint8_t>& vchAddr, const CCoin& coin);

    /**
     * Remove the coin (txid, nIndex) from the address's list.
     *
     * The matching entry is overwritten by the last element and the list
     * shrinks by one, so list order is not preserved.
     * @param[out] pRemoved If given, receives the removed coin
     * @return false if no such coin, list unchanged
     */
    bool Remove(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex,
                CCoin* pRemoved = nullptr);

    bool HaveCoin(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex) const;

    std::vector<CCoin> GetCoins(const std::vector<uint8_t>& vchAddr) const;

    //! Coins of an address sorted by ascending value
    std::vector<CCoin> GetCoinsByValue(const std::vector<uint8_t>& vchAddr) const;

    //! Every address with a list, including emptied ones
    std::vector<std::vector<uint8_t>> GetAddresses() const;

    size_t GetCoinCount(const std::vector<uint8_t>& vchAddr) const;
    size_t GetTotalCoinCount() const;

    uint64_t GetBalance(const std::vector<uint8_t>& vchAddr) const;
    uint64_t GetTotalBalance() const;

    void Clear();

    /** Replace the contents with coins read back from storage */
    void Load(const std::vector<CCoin>& coins);
};

#endif // TALLY_WALLET_COINS_H
