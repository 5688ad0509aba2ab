// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <core/wallet_context.h>
#include <util/config.h>
#include <util/logging.h>
#include <wallet/coins.h>
#include <wallet/keystore.h>
#include <wallet/txprocessor.h>
#include <wallet/walletdb.h>

#include <filesystem>
#include <system_error>

static const int64_t DEFAULT_DB_CACHE_MIB = 8;

WalletContext::WalletContext() {
}

WalletContext::~WalletContext() {
    Shutdown();
}

bool WalletContext::Init(const CConfigParser& config) {
    if (IsInitialized()) {
        LogPrintWallet(WARN, "WalletContext already initialized");
        return false;
    }

    datadir = config.GetString("datadir", GetDefaultDataDir());

    keystore = std::make_unique<CBasicKeyStore>();
    coins = std::make_unique<CCoinRegistry>();
    processor = std::make_unique<CTxProcessor>(*keystore, *coins);

    if (config.GetBool("walletdb", true)) {
        std::error_code ec;
        std::filesystem::create_directories(datadir, ec);
        if (ec) {
            LogPrintWallet(ERROR, "Cannot create data directory %s: %s", datadir.c_str(), ec.message().c_str());
            Reset();
            return false;
        }

        int64_t cacheMiB = config.GetInt64("dbcache", DEFAULT_DB_CACHE_MIB);
        if (cacheMiB < 0) {
            LogPrintWallet(WARN, "Negative dbcache %lld, using %lld MiB",
                           static_cast<long long>(cacheMiB), static_cast<long long>(DEFAULT_DB_CACHE_MIB));
            cacheMiB = DEFAULT_DB_CACHE_MIB;
        }

        walletdb = std::make_unique<CWalletDB>();
        std::string path = datadir + "/wallet";
        DBErrorType err;
        if (!walletdb->Open(path, static_cast<size_t>(cacheMiB) * 1024 * 1024, &err)) {
            LogPrintWallet(ERROR, "Failed to open wallet database %s (%s)", path.c_str(), GetDBErrorName(err));
            Reset();
            return false;
        }

        std::vector<CCoin> stored;
        if (!walletdb->LoadCoins(stored, &err)) {
            LogPrintWallet(ERROR, "Failed to load coins from %s (%s)", path.c_str(), GetDBErrorName(err));
            Reset();
            return false;
        }
        coins->Load(stored);
        LogPrintWallet(INFO, "Loaded %zu coins from wallet database", stored.size());
    }

    LogPrintWallet(INFO, "WalletContext initialized (datadir %s)", datadir.c_str());
    return true;
}

CTxScanResult WalletContext::ProcessTransaction(const CTransaction& tx) {
    if (!IsInitialized()) {
        LogPrintWallet(ERROR, "WalletContext::ProcessTransaction called before Init");
        return CTxScanResult();
    }

    CTxScanResult result = processor->ProcessTransaction(tx);

    if (walletdb && (result.nCoinsAdded > 0 || result.nCoinsRemoved > 0)) {
        DBErrorType err;
        if (!walletdb->MirrorScanResult(result, &err)) {
            LogPrintWallet(ERROR, "Failed to persist coins of tx %s (%s)",
                           result.txid.GetHex().c_str(), GetDBErrorName(err));
        }
    }

    return result;
}

void WalletContext::Shutdown() {
    if (!IsInitialized() && !walletdb) {
        return;
    }

    LogPrintWallet(INFO, "Shutting down WalletContext...");
    Reset();
    LogPrintWallet(INFO, "WalletContext shutdown complete");
}

void WalletContext::Reset() {
    processor.reset();
    if (walletdb) {
        walletdb->Close();
        walletdb.reset();
    }
    coins.reset();
    keystore.reset();
}
