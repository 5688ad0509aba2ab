// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_CORE_WALLET_CONTEXT_H
#define TALLY_CORE_WALLET_CONTEXT_H

#include <memory>
#include <string>

class CBasicKeyStore;
class CCoinRegistry;
class CConfigParser;
class CTransaction;
class CTxProcessor;
class CWalletDB;
struct CTxScanResult;

/**
 * WalletContext - owns the wallet core components
 *
 * Keystore, coin registry, transaction processor and (optionally) the
 * wallet database, with explicit initialization and shutdown. There is no
 * global instance; the owner passes the context (or its members) to
 * whatever needs them.
 */
struct WalletContext {
    std::unique_ptr<CBasicKeyStore> keystore;
    std::unique_ptr<CCoinRegistry> coins;
    std::unique_ptr<CTxProcessor> processor;
    std::unique_ptr<CWalletDB> walletdb;   // Null when walletdb=0

    std::string datadir;

    WalletContext();
    ~WalletContext();

    WalletContext(const WalletContext&) = delete;
    WalletContext& operator=(const WalletContext&) = delete;

    bool IsInitialized() const {
        return keystore != nullptr && coins != nullptr && processor != nullptr;
    }

    /**
     * Initialize from configuration
     *
     * Keys: datadir (default $HOME/.tally), walletdb (default 1),
     * dbcache (MiB, default 8). With storage enabled the database is opened
     * at <datadir>/wallet and persisted coins are loaded into the registry.
     *
     * @return false if already initialized or storage could not be opened
     */
    bool Init(const CConfigParser& config);

    /**
     * Scan a transaction and, with storage enabled, mirror the coins it
     * added and removed into the database
     */
    CTxScanResult ProcessTransaction(const CTransaction& tx);

    /**
     * Close storage and release all components. Safe to call multiple times.
     */
    void Shutdown();

private:
    // unique_ptr::reset() requires complete types, defined in wallet_context.cpp
    void Reset();
};

#endif // TALLY_CORE_WALLET_CONTEXT_H
