// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_WALLET_TXPROCESSOR_H
#define TALLY_WALLET_TXPROCESSOR_H

#include <primitives/transaction.h>
#include <wallet/coins.h>
#include <wallet/keystore.h>

#include <cstdint>
#include <string>
#include <vector>

/**
 * What happened to one input or output of a scanned transaction
 */
enum class TxItemStatus {
    COIN_ADDED,          // Owned output, coin recorded
    COIN_REMOVED,        // Owned input, spent coin retired
    COINBASE,            // Coinbase input, nothing to spend
    DECODE_ERROR,        // Script did not match any known template
    UNSUPPORTED_FORMAT,  // Known but unhandled script form
    INVALID_PUBKEY,      // Embedded key bytes are not a valid point
    NOT_OWNED,           // Well formed but not ours
    COIN_NOT_FOUND,      // Owned input whose coin is not in the registry
    COIN_EXISTS,         // Owned output already recorded (transaction seen before)
};

const char* GetTxItemStatusName(TxItemStatus status);

struct CTxItemOutcome {
    enum Direction { INPUT, OUTPUT };

    Direction direction;
    uint32_t nPosition;
    TxItemStatus status;
    std::string strMessage;   // Diagnostic for non-success states
    CCoin coin;               // Valid for COIN_ADDED / COIN_REMOVED

    CTxItemOutcome(Direction directionIn, uint32_t nPositionIn, TxItemStatus statusIn)
        : direction(directionIn), nPosition(nPositionIn), status(statusIn) {}
};

/**
 * Result of scanning one transaction
 */
struct CTxScanResult {
    uint256 txid;
    std::vector<CTxItemOutcome> vOutcomes;

    size_t nCoinsAdded;
    size_t nCoinsRemoved;
    size_t nSkipped;    // Every item that neither added nor removed a coin

    CTxScanResult() : nCoinsAdded(0), nCoinsRemoved(0), nSkipped(0) {}

    void Record(CTxItemOutcome outcome);

    /** Coins added, in output order */
    std::vector<CCoin> GetAddedCoins() const;
    /** Coins removed, in input order */
    std::vector<CCoin> GetRemovedCoins() const;
};

/**
 * Transaction Processor
 *
 * Scans a decoded transaction against the wallet's keys and updates the
 * coin registry: owned outputs become coins, recognized owned inputs retire
 * the coin they spend. Problems with individual inputs and outputs are
 * logged (WALLET category), recorded in the result and skipped; the scan
 * itself never fails.
 *
 * Safe to call from several threads against the same registry.
 */
class CTxProcessor
{
private:
    const CKeyStore& m_keystore;
    CCoinRegistry& m_coins;

    void ProcessInput(const uint256& txid, uint32_t nPosition, const CTxIn& txin, CTxScanResult& result);
    void ProcessOutput(const uint256& txid, uint32_t nPosition, const CTxOut& txout, CTxScanResult& result);

public:
    CTxProcessor(const CKeyStore& keystore, CCoinRegistry& coins)
        : m_keystore(keystore), m_coins(coins) {}

    /**
     * Absorb a transaction: inputs first, then outputs
     */
    CTxScanResult ProcessTransaction(const CTransaction& tx);

    /**
     * Decode a wire transaction and absorb it.
     * A transaction that does not decode is logged and yields an empty result.
     */
    CTxScanResult ProcessTransactionBytes(const uint8_t* data, size_t len);
    CTxScanResult ProcessTransactionBytes(const std::vector<uint8_t>& data) {
        return ProcessTransactionBytes(data.data(), data.size());
    }
};

#endif // TALLY_WALLET_TXPROCESSOR_H
