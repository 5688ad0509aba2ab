// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <wallet/txprocessor.h>
#include <script/matcher.h>
#include <util/logging.h>
#include <util/strencodings.h>

const char* GetTxItemStatusName(TxItemStatus status) {
    switch (status) {
        case TxItemStatus::COIN_ADDED: return "coin added";
        case TxItemStatus::COIN_REMOVED: return "coin removed";
        case TxItemStatus::COINBASE: return "coinbase";
        case TxItemStatus::DECODE_ERROR: return "decode error";
        case TxItemStatus::UNSUPPORTED_FORMAT: return "unsupported format";
        case TxItemStatus::INVALID_PUBKEY: return "invalid public key";
        case TxItemStatus::NOT_OWNED: return "not owned";
        case TxItemStatus::COIN_NOT_FOUND: return "coin not found";
        case TxItemStatus::COIN_EXISTS: return "coin already recorded";
    }
    return "unknown";
}

void CTxScanResult::Record(CTxItemOutcome outcome) {
    if (outcome.status == TxItemStatus::COIN_ADDED) {
        nCoinsAdded++;
    } else if (outcome.status == TxItemStatus::COIN_REMOVED) {
        nCoinsRemoved++;
    } else {
        nSkipped++;
    }
    vOutcomes.push_back(std::move(outcome));
}

std::vector<CCoin> CTxScanResult::GetAddedCoins() const {
    std::vector<CCoin> coins;
    for (const CTxItemOutcome& outcome : vOutcomes) {
        if (outcome.status == TxItemStatus::COIN_ADDED) {
            coins.push_back(outcome.coin);
        }
    }
    return coins;
}

std::vector<CCoin> CTxScanResult::GetRemovedCoins() const {
    std::vector<CCoin> coins;
    for (const CTxItemOutcome& outcome : vOutcomes) {
        if (outcome.status == TxItemStatus::COIN_REMOVED) {
            coins.push_back(outcome.coin);
        }
    }
    return coins;
}

static TxItemStatus ToItemStatus(ScriptMatchStatus status) {
    return status == ScriptMatchStatus::UNSUPPORTED_FORMAT ? TxItemStatus::UNSUPPORTED_FORMAT
                                                           : TxItemStatus::DECODE_ERROR;
}

static void Skip(CTxScanResult& result, CTxItemOutcome::Direction direction, uint32_t nPosition,
                 TxItemStatus status, const std::string& message) {
    const char* what = direction == CTxItemOutcome::INPUT ? "input" : "output";
    if (status == TxItemStatus::NOT_OWNED || status == TxItemStatus::COIN_EXISTS) {
        LogPrintWallet(DEBUG, "tx %s %s %u: %s", result.txid.GetHex().c_str(), what, nPosition, message.c_str());
    } else {
        LogPrintWallet(WARN, "tx %s %s %u: %s (%s)", result.txid.GetHex().c_str(), what, nPosition,
                       message.c_str(), GetTxItemStatusName(status));
    }

    CTxItemOutcome outcome(direction, nPosition, status);
    outcome.strMessage = message;
    result.Record(std::move(outcome));
}

void CTxProcessor::ProcessInput(const uint256& txid, uint32_t nPosition, const CTxIn& txin, CTxScanResult& result) {
    // Coinbase inputs spend nothing; not worth a log line
    if (txin.prevout.IsNull()) {
        result.Record(CTxItemOutcome(CTxItemOutcome::INPUT, nPosition, TxItemStatus::COINBASE));
        return;
    }

    CDataReader reader(txin.scriptSig);
    std::string error;

    CScriptSigHeader header;
    ScriptMatchStatus status = DecodeScriptSigHeader(reader, header, &error);
    if (status != ScriptMatchStatus::OK) {
        Skip(result, CTxItemOutcome::INPUT, nPosition, ToItemStatus(status), error);
        return;
    }

    CScriptSigTail tail;
    status = DecodeScriptSigTail(reader, tail, &error);
    if (status != ScriptMatchStatus::OK) {
        Skip(result, CTxItemOutcome::INPUT, nPosition, ToItemStatus(status), error);
        return;
    }

    CPubKey pubkey(tail.vchPubKey);
    if (!pubkey.IsValid()) {
        Skip(result, CTxItemOutcome::INPUT, nPosition, TxItemStatus::INVALID_PUBKEY,
             "signature script public key is not a valid point: " + HexStr(tail.vchPubKey));
        return;
    }

    if (!m_keystore.HaveKey(pubkey)) {
        Skip(result, CTxItemOutcome::INPUT, nPosition, TxItemStatus::NOT_OWNED,
             "spending key " + pubkey.GetAddress() + " is not ours");
        return;
    }

    CCoin spent;
    if (!m_coins.Remove(pubkey.Serialize(), txin.prevout.hash, txin.prevout.n, &spent)) {
        Skip(result, CTxItemOutcome::INPUT, nPosition, TxItemStatus::COIN_NOT_FOUND,
             strprintf("no coin %s:%u for %s", txin.prevout.hash.GetHex().c_str(), txin.prevout.n,
                       pubkey.GetAddress().c_str()));
        return;
    }

    LogPrintWallet(INFO, "tx %s input %u: spent %s:%u (%llu) from %s", txid.GetHex().c_str(), nPosition,
                   spent.txid.GetHex().c_str(), spent.nIndex, static_cast<unsigned long long>(spent.nValue),
                   pubkey.GetAddress().c_str());

    CTxItemOutcome outcome(CTxItemOutcome::INPUT, nPosition, TxItemStatus::COIN_REMOVED);
    outcome.coin = spent;
    result.Record(std::move(outcome));
}

void CTxProcessor::ProcessOutput(const uint256& txid, uint32_t nPosition, const CTxOut& txout, CTxScanResult& result) {
    std::string error;
    COutputMatch match;
    if (MatchOutputScript(txout.scriptPubKey, match, &error) != ScriptMatchStatus::OK) {
        Skip(result, CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::DECODE_ERROR, error);
        return;
    }

    CPubKey pubkey;
    if (match.type == CoinType::PUBKEY) {
        if (!pubkey.Set(match.vchData.data(), match.vchData.data() + match.vchData.size())) {
            Skip(result, CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::INVALID_PUBKEY,
                 "output public key is not a valid point: " + HexStr(match.vchData));
            return;
        }
        if (!m_keystore.HaveKey(pubkey)) {
            Skip(result, CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::NOT_OWNED,
                 "paid to key " + pubkey.GetAddress() + ", not ours");
            return;
        }
    } else {
        if (!m_keystore.GetPubKeyByHash(match.vchData, pubkey)) {
            Skip(result, CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::NOT_OWNED,
                 "paid to key hash " + HexStr(match.vchData) + ", not ours");
            return;
        }
    }

    CCoin coin(pubkey.Serialize(), txid, nPosition, txout.nValue, match.type);
    if (!m_coins.Add(coin.vchAddr, coin)) {
        Skip(result, CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::COIN_EXISTS,
             strprintf("coin %s:%u already recorded for %s", txid.GetHex().c_str(), nPosition,
                       pubkey.GetAddress().c_str()));
        return;
    }

    LogPrintWallet(INFO, "tx %s output %u: received %llu to %s (%s)", txid.GetHex().c_str(), nPosition,
                   static_cast<unsigned long long>(txout.nValue), pubkey.GetAddress().c_str(),
                   GetCoinTypeName(match.type));

    CTxItemOutcome outcome(CTxItemOutcome::OUTPUT, nPosition, TxItemStatus::COIN_ADDED);
    outcome.coin = coin;
    result.Record(std::move(outcome));
}

CTxScanResult CTxProcessor::ProcessTransaction(const CTransaction& tx) {
    CTxScanResult result;
    result.txid = tx.GetHash();

    for (size_t i = 0; i < tx.vin.size(); ++i) {
        ProcessInput(result.txid, static_cast<uint32_t>(i), tx.vin[i], result);
    }

    for (size_t i = 0; i < tx.vout.size(); ++i) {
        ProcessOutput(result.txid, static_cast<uint32_t>(i), tx.vout[i], result);
    }

    if (result.nCoinsAdded > 0 || result.nCoinsRemoved > 0) {
        LogPrintWallet(DEBUG, "tx %s: %zu coins added, %zu removed, %zu items skipped",
                       result.txid.GetHex().c_str(), result.nCoinsAdded, result.nCoinsRemoved, result.nSkipped);
    }

    return result;
}

CTxScanResult CTxProcessor::ProcessTransactionBytes(const uint8_t* data, size_t len) {
    CTransaction tx;
    std::string error;
    if (!tx.Deserialize(data, len, &error)) {
        LogPrintWallet(ERROR, "Failed to decode transaction (%zu bytes): %s", len, error.c_str());
        return CTxScanResult();
    }
    return ProcessTransaction(tx);
}
