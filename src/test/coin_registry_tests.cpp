// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

/**
 * UTXO registry tests
 *
 * Add/remove bookkeeping, the swap-with-last removal, snapshots, balances,
 * coin record serialization and concurrent mutation.
 */

#include <boost/test/unit_test.hpp>

#include <wallet/coins.h>
#include <test/util/wallet_test_util.h>

#include <atomic>
#include <thread>
#include <vector>

BOOST_AUTO_TEST_SUITE(coin_registry_tests)

static std::vector<uint8_t> TestAddress(uint8_t seed) {
    return std::vector<uint8_t>(33, seed);
}

static CCoin MakeCoin(const std::vector<uint8_t>& addr, uint8_t hashSeed, uint32_t n, uint64_t value) {
    return CCoin(addr, MakeTestHash(hashSeed), n, value, CoinType::PUBKEYHASH);
}

BOOST_AUTO_TEST_CASE(add_then_remove_restores_count) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x01);

    registry.Add(addr, MakeCoin(addr, 0x10, 0, 500));
    size_t before = registry.GetCoinCount(addr);

    registry.Add(addr, MakeCoin(addr, 0x20, 3, 700));
    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), before + 1);

    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0x20), 3));
    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), before);
    BOOST_CHECK(!registry.HaveCoin(addr, MakeTestHash(0x20), 3));
    BOOST_CHECK(registry.HaveCoin(addr, MakeTestHash(0x10), 0));
}

BOOST_AUTO_TEST_CASE(remove_absent_coin_leaves_list_unchanged) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x02);

    registry.Add(addr, MakeCoin(addr, 0x10, 0, 100));
    registry.Add(addr, MakeCoin(addr, 0x11, 1, 200));
    std::vector<CCoin> before = registry.GetCoins(addr);

    // Same hash, other index; other hash, same index; unknown address
    BOOST_CHECK(!registry.Remove(addr, MakeTestHash(0x10), 1));
    BOOST_CHECK(!registry.Remove(addr, MakeTestHash(0x12), 0));
    BOOST_CHECK(!registry.Remove(TestAddress(0x03), MakeTestHash(0x10), 0));

    std::vector<CCoin> after = registry.GetCoins(addr);
    BOOST_REQUIRE_EQUAL(after.size(), before.size());
    for (size_t i = 0; i < after.size(); ++i) {
        BOOST_CHECK(after[i] == before[i]);
    }
}

BOOST_AUTO_TEST_CASE(duplicate_add_is_ignored) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x08);

    BOOST_CHECK(registry.Add(addr, MakeCoin(addr, 0x30, 1, 1000)));
    BOOST_CHECK(!registry.Add(addr, MakeCoin(addr, 0x30, 1, 1000)));
    // Same outpoint with another value is still the same coin
    BOOST_CHECK(!registry.Add(addr, MakeCoin(addr, 0x30, 1, 5)));
    BOOST_CHECK(registry.Add(addr, MakeCoin(addr, 0x30, 2, 1000)));

    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), 2U);
    BOOST_CHECK_EQUAL(registry.GetBalance(addr), 2000U);

    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0x30), 1));
    BOOST_CHECK(!registry.HaveCoin(addr, MakeTestHash(0x30), 1));
}

BOOST_AUTO_TEST_CASE(remove_reports_removed_coin) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x09);
    CCoin first(addr, MakeTestHash(0xb0), 0, 11, CoinType::PUBKEY);
    CCoin second = MakeCoin(addr, 0xb1, 4, 22);
    registry.Add(addr, first);
    registry.Add(addr, second);

    CCoin removed;
    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0xb0), 0, &removed));
    BOOST_CHECK(removed == first);

    // A miss leaves the out parameter alone
    CCoin untouched = second;
    BOOST_CHECK(!registry.Remove(addr, MakeTestHash(0xb0), 0, &untouched));
    BOOST_CHECK(untouched == second);
}

BOOST_AUTO_TEST_CASE(remove_swaps_last_into_place) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x04);

    registry.Add(addr, MakeCoin(addr, 0xa0, 0, 1));
    registry.Add(addr, MakeCoin(addr, 0xa1, 0, 2));
    registry.Add(addr, MakeCoin(addr, 0xa2, 0, 3));

    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0xa0), 0));

    std::vector<CCoin> coins = registry.GetCoins(addr);
    BOOST_REQUIRE_EQUAL(coins.size(), 2U);
    BOOST_CHECK(coins[0].txid == MakeTestHash(0xa2));
    BOOST_CHECK(coins[1].txid == MakeTestHash(0xa1));

    // Removing the last element needs no swap
    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0xa1), 0));
    coins = registry.GetCoins(addr);
    BOOST_REQUIRE_EQUAL(coins.size(), 1U);
    BOOST_CHECK(coins[0].txid == MakeTestHash(0xa2));
}

BOOST_AUTO_TEST_CASE(emptied_address_stays_listed) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x05);

    BOOST_CHECK(registry.GetAddresses().empty());
    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), 0U);
    BOOST_CHECK(registry.GetCoins(addr).empty());

    registry.Add(addr, MakeCoin(addr, 0x01, 0, 10));
    BOOST_CHECK(registry.Remove(addr, MakeTestHash(0x01), 0));

    std::vector<std::vector<uint8_t>> addresses = registry.GetAddresses();
    BOOST_REQUIRE_EQUAL(addresses.size(), 1U);
    BOOST_CHECK(addresses[0] == addr);
    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), 0U);
}

BOOST_AUTO_TEST_CASE(balances_and_value_order) {
    CCoinRegistry registry;
    std::vector<uint8_t> a = TestAddress(0x06);
    std::vector<uint8_t> b = TestAddress(0x07);

    registry.Add(a, MakeCoin(a, 0x01, 0, 300));
    registry.Add(a, MakeCoin(a, 0x02, 0, 100));
    registry.Add(a, MakeCoin(a, 0x03, 0, 200));
    registry.Add(b, MakeCoin(b, 0x04, 0, 50));

    BOOST_CHECK_EQUAL(registry.GetBalance(a), 600U);
    BOOST_CHECK_EQUAL(registry.GetBalance(b), 50U);
    BOOST_CHECK_EQUAL(registry.GetBalance(TestAddress(0x08)), 0U);
    BOOST_CHECK_EQUAL(registry.GetTotalBalance(), 650U);
    BOOST_CHECK_EQUAL(registry.GetTotalCoinCount(), 4U);

    std::vector<CCoin> sorted = registry.GetCoinsByValue(a);
    BOOST_REQUIRE_EQUAL(sorted.size(), 3U);
    BOOST_CHECK_EQUAL(sorted[0].nValue, 100U);
    BOOST_CHECK_EQUAL(sorted[1].nValue, 200U);
    BOOST_CHECK_EQUAL(sorted[2].nValue, 300U);

    // Insertion order is untouched by the sorted view
    BOOST_CHECK_EQUAL(registry.GetCoins(a)[0].nValue, 300U);
}

BOOST_AUTO_TEST_CASE(snapshots_are_copies) {
    CCoinRegistry registry;
    std::vector<uint8_t> addr = TestAddress(0x09);
    registry.Add(addr, MakeCoin(addr, 0x01, 0, 10));

    std::vector<CCoin> snapshot = registry.GetCoins(addr);
    registry.Add(addr, MakeCoin(addr, 0x02, 0, 20));

    BOOST_CHECK_EQUAL(snapshot.size(), 1U);
    BOOST_CHECK_EQUAL(registry.GetCoinCount(addr), 2U);
}

BOOST_AUTO_TEST_CASE(load_and_clear) {
    CCoinRegistry registry;
    std::vector<uint8_t> a = TestAddress(0x0a);
    std::vector<uint8_t> b = TestAddress(0x0b);
    registry.Add(a, MakeCoin(a, 0xff, 0, 1));

    std::vector<CCoin> stored = {MakeCoin(a, 0x01, 0, 10), MakeCoin(b, 0x02, 1, 20), MakeCoin(a, 0x03, 2, 30)};
    registry.Load(stored);

    BOOST_CHECK_EQUAL(registry.GetTotalCoinCount(), 3U);
    BOOST_CHECK_EQUAL(registry.GetCoinCount(a), 2U);
    BOOST_CHECK(!registry.HaveCoin(a, MakeTestHash(0xff), 0));
    BOOST_CHECK(registry.HaveCoin(b, MakeTestHash(0x02), 1));

    registry.Clear();
    BOOST_CHECK_EQUAL(registry.GetTotalCoinCount(), 0U);
    BOOST_CHECK(registry.GetAddresses().empty());
}

BOOST_AUTO_TEST_CASE(coin_serialization) {
    CCoin coin(ParseHex(TEST_PUBKEY_G), MakeTestHash(0x5a), 7, 123456789, CoinType::PUBKEY);
    std::vector<uint8_t> data = coin.Serialize();
    BOOST_CHECK_EQUAL(data.size(), 1U + 4 + 8 + 32 + 1 + 33);

    CCoin decoded;
    std::string error;
    BOOST_REQUIRE(decoded.Deserialize(data, &error));
    BOOST_CHECK(decoded == coin);

    std::vector<uint8_t> truncated(data.begin(), data.end() - 1);
    BOOST_CHECK(!decoded.Deserialize(truncated, &error));
    BOOST_CHECK(error.find("truncated") != std::string::npos);

    std::vector<uint8_t> badType = data;
    badType[0] = 0x07;
    BOOST_CHECK(!decoded.Deserialize(badType, &error));

    std::vector<uint8_t> trailing = data;
    trailing.push_back(0x00);
    BOOST_CHECK(!decoded.Deserialize(trailing, &error));
}

BOOST_AUTO_TEST_CASE(concurrent_disjoint_updates) {
    CCoinRegistry registry;
    const int nThreads = 8;
    const int nCoinsPerThread = 500;

    // Two threads per address, so list contention is real
    std::atomic<int> nMissing{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < nThreads; ++t) {
        threads.emplace_back([&registry, &nMissing, t]() {
            std::vector<uint8_t> addr = TestAddress(static_cast<uint8_t>(t % 4));
            for (int i = 0; i < nCoinsPerThread; ++i) {
                uint32_t n = static_cast<uint32_t>(t * nCoinsPerThread + i);
                registry.Add(addr, CCoin(addr, MakeTestHash(0x01), n, 1, CoinType::PUBKEYHASH));
            }
            // Remove every other coin this thread added
            for (int i = 0; i < nCoinsPerThread; i += 2) {
                uint32_t n = static_cast<uint32_t>(t * nCoinsPerThread + i);
                if (!registry.Remove(addr, MakeTestHash(0x01), n)) {
                    nMissing++;
                }
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_EQUAL(nMissing.load(), 0);
    BOOST_CHECK_EQUAL(registry.GetTotalCoinCount(), static_cast<size_t>(nThreads * nCoinsPerThread / 2));
    BOOST_CHECK_EQUAL(registry.GetTotalBalance(), static_cast<uint64_t>(nThreads * nCoinsPerThread / 2));
    for (int t = 0; t < 4; ++t) {
        BOOST_CHECK_EQUAL(registry.GetCoinCount(TestAddress(static_cast<uint8_t>(t))),
                          static_cast<size_t>(2 * nCoinsPerThread / 2));
    }
}

BOOST_AUTO_TEST_SUITE_END()
