// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <wallet/coins.h>
#include <serialize.h>
#include <util/strencodings.h>

#include <algorithm>
#include <stdexcept>

// Serialized coin: [type:1][index:4][value:8][txid:32][addrLen:compact][addr]
std::vector<uint8_t> CCoin::Serialize() const {
    std::vector<uint8_t> data;
    data.reserve(1 + 4 + 8 + 32 + 1 + vchAddr.size());

    data.push_back(static_cast<uint8_t>(type));
    WriteUint32LE(data, nIndex);
    WriteUint64LE(data, nValue);
    data.insert(data.end(), txid.begin(), txid.end());
    WriteCompactSize(data, vchAddr.size());
    data.insert(data.end(), vchAddr.begin(), vchAddr.end());

    return data;
}

bool CCoin::Deserialize(const std::vector<uint8_t>& data, std::string* error) {
    CDataReader reader(data);

    uint8_t nType;
    if (!reader.ReadByte(nType)) {
        if (error) *error = "Coin record truncated (type)";
        return false;
    }
    if (nType > static_cast<uint8_t>(CoinType::PUBKEY)) {
        if (error) *error = strprintf("Unknown coin type %u", nType);
        return false;
    }

    uint32_t index;
    uint64_t value;
    if (!reader.ReadUint32LE(index) || !reader.ReadUint64LE(value)) {
        if (error) *error = "Coin record truncated (index/value)";
        return false;
    }

    uint256 hash;
    if (!reader.ReadBytes(32, hash.begin())) {
        if (error) *error = "Coin record truncated (txid)";
        return false;
    }

    uint64_t addrLen;
    std::vector<uint8_t> addr;
    if (!reader.ReadCompactSize(addrLen) || addrLen > reader.Remaining() ||
        !reader.ReadBytes(static_cast<size_t>(addrLen), addr)) {
        if (error) *error = "Coin record truncated (address)";
        return false;
    }

    if (!reader.IsEmpty()) {
        if (error) *error = "Extra data after coin record";
        return false;
    }

    type = static_cast<CoinType>(nType);
    nIndex = index;
    nValue = value;
    txid = hash;
    vchAddr = std::move(addr);
    return true;
}

std::string CCoin::ToString() const {
    return strprintf("CCoin(addr=%s, txid=%s, n=%u, value=%llu, type=%s)",
                     HexStr(vchAddr).c_str(), txid.GetHex().c_str(), nIndex,
                     static_cast<unsigned long long>(nValue), GetCoinTypeName(type));
}

bool CCoinRegistry::Add(const std::vector<uint8_t>& vchAddr, const CCoin& coin) {
    std::lock_guard<std::mutex> lock(cs_coins);

    std::vector<CCoin>& coins = mapCoins[vchAddr];
    for (const CCoin& existing : coins) {
        if (existing.txid == coin.txid && existing.nIndex == coin.nIndex) {
            return false;
        }
    }
    coins.push_back(coin);
    return true;
}

bool CCoinRegistry::Remove(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex,
                           CCoin* pRemoved) {
    std::lock_guard<std::mutex> lock(cs_coins);

    auto it = mapCoins.find(vchAddr);
    if (it == mapCoins.end()) {
        return false;
    }

    std::vector<CCoin>& coins = it->second;
    for (size_t i = 0; i < coins.size(); ++i) {
        if (coins[i].txid == txid && coins[i].nIndex == nIndex) {
            if (pRemoved) {
                *pRemoved = coins[i];
            }
            if (i != coins.size() - 1) {
                coins[i] = std::move(coins.back());
            }
            coins.pop_back();
            return true;
        }
    }

    return false;
}

bool CCoinRegistry::HaveCoin(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex) const {
    std::lock_guard<std::mutex> lock(cs_coins);

    auto it = mapCoins.find(vchAddr);
    if (it == mapCoins.end()) {
        return false;
    }

    for (const CCoin& coin : it->second) {
        if (coin.txid == txid && coin.nIndex == nIndex) {
            return true;
        }
    }
    return false;
}

std::vector<CCoin> CCoinRegistry::GetCoins(const std::vector<uint8_t>& vchAddr) const {
    std::lock_guard<std::mutex> lock(cs_coins);

    auto it = mapCoins.find(vchAddr);
    if (it == mapCoins.end()) {
        return std::vector<CCoin>();
    }
    return it->second;
}

std::vector<CCoin> CCoinRegistry::GetCoinsByValue(const std::vector<uint8_t>& vchAddr) const {
    std::vector<CCoin> coins = GetCoins(vchAddr);
    std::stable_sort(coins.begin(), coins.end(), CoinValueCompare());
    return coins;
}

std::vector<std::vector<uint8_t>> CCoinRegistry::GetAddresses() const {
    std::lock_guard<std::mutex> lock(cs_coins);

    std::vector<std::vector<uint8_t>> addresses;
    addresses.reserve(mapCoins.size());
    for (const auto& entry : mapCoins) {
        addresses.push_back(entry.first);
    }
    return addresses;
}

size_t CCoinRegistry::GetCoinCount(const std::vector<uint8_t>& vchAddr) const {
    std::lock_guard<std::mutex> lock(cs_coins);

    auto it = mapCoins.find(vchAddr);
    return it == mapCoins.end() ? 0 : it->second.size();
}

size_t CCoinRegistry::GetTotalCoinCount() const {
    std::lock_guard<std::mutex> lock(cs_coins);

    size_t count = 0;
    for (const auto& entry : mapCoins) {
        count += entry.second.size();
    }
    return count;
}

static uint64_t SumValues(const std::vector<CCoin>& coins) {
    uint64_t total = 0;
    for (const CCoin& coin : coins) {
        if (total + coin.nValue < total) {
            throw std::runtime_error("CCoinRegistry: balance overflow");
        }
        total += coin.nValue;
    }
    return total;
}

uint64_t CCoinRegistry::GetBalance(const std::vector<uint8_t>& vchAddr) const {
    std::lock_guard<std::mutex> lock(cs_coins);

    auto it = mapCoins.find(vchAddr);
    if (it == mapCoins.end()) {
        return 0;
    }
    return SumValues(it->second);
}

uint64_t CCoinRegistry::GetTotalBalance() const {
    std::lock_guard<std::mutex> lock(cs_coins);

    uint64_t total = 0;
    for (const auto& entry : mapCoins) {
        uint64_t balance = SumValues(entry.second);
        if (total + balance < total) {
            throw std::runtime_error("CCoinRegistry: balance overflow");
        }
        total += balance;
    }
    return total;
}

void CCoinRegistry::Clear() {
    std::lock_guard<std::mutex> lock(cs_coins);
    mapCoins.clear();
}

void CCoinRegistry::Load(const std::vector<CCoin>& coins) {
    std::lock_guard<std::mutex> lock(cs_coins);

    mapCoins.clear();
    for (const CCoin& coin : coins) {
        mapCoins[coin.vchAddr].push_back(coin);
    }
}
