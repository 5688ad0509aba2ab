// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_WALLET_WALLETDB_H
#define TALLY_WALLET_WALLETDB_H

#include <db/db_errors.h>
#include <wallet/coins.h>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct CTxScanResult;

/** Bucket holding the coin mirror */
static const char* const COIN_BUCKET = "coin";

/**
 * Composite key builder
 *
 * Integers are appended as 8 bytes little endian, strings verbatim followed
 * by a NUL terminator (so string components can be recovered with
 * GetPrefixes), raw bytes verbatim.
 */
class CDBKey
{
private:
    std::string m_key;

public:
    CDBKey() {}

    CDBKey& PushInt(uint64_t n);
    CDBKey& PushString(const std::string& str);
    CDBKey& PushBytes(const std::vector<uint8_t>& vch);
    CDBKey& PushBytes(const uint8_t* data, size_t len);

    const std::string& str() const { return m_key; }
    size_t size() const { return m_key.size(); }
};

/** 8-byte little endian value encoding */
std::string EncodeDBInt(uint64_t n);
bool DecodeDBInt(const std::string& value, uint64_t& n);

/** Set-of-strings value encoding: [count][len][bytes]... with compact sizes */
std::string EncodeStringSet(const std::set<std::string>& members);
bool DecodeStringSet(const std::string& value, std::set<std::string>& members);

/**
 * Pending writes applied atomically by CWalletDB::WriteBatch
 */
class CWalletDBBatch
{
private:
    friend class CWalletDB;
    leveldb::WriteBatch m_batch;
    size_t m_nOps;

public:
    CWalletDBBatch() : m_nOps(0) {}

    bool Put(const std::string& bucket, const std::string& key, const std::string& value);
    bool Erase(const std::string& bucket, const std::string& key);

    size_t Size() const { return m_nOps; }
    bool IsEmpty() const { return m_nOps == 0; }
};

/**
 * Wallet database
 *
 * Typed key/value store on LevelDB with named buckets. A bucket exists once
 * something has been written to it; reads from a bucket that was never
 * written report BUCKET_NOT_FOUND, reads of a missing key NOT_FOUND.
 *
 * Layout:
 *   'b' + bucket                    -> ""       bucket marker
 *   'd' + bucket + '\0' + key       -> value    record
 *
 * All methods return false on failure and store the classified error in the
 * optional DBErrorType out parameter. Failures other than NOT_FOUND and
 * BUCKET_NOT_FOUND are logged in the DB category.
 *
 * Thread Safety: all methods lock cs_db.
 */
class CWalletDB
{
private:
    std::unique_ptr<leveldb::Cache> m_cache;   // Must outlive db
    std::unique_ptr<leveldb::DB> db;
    mutable std::mutex cs_db;
    std::string m_path;

    bool CheckOpen(DBErrorType* err) const;
    bool BucketExistsUnlocked(const std::string& bucket) const;
    bool ReadUnlocked(const std::string& bucket, const std::string& key, std::string& value, DBErrorType* err) const;
    bool WriteUnlocked(leveldb::WriteBatch& batch, DBErrorType* err, const char* what);

    /** Visit every record of a bucket whose key starts with prefix */
    template <typename Callback>
    bool ForEachUnlocked(const std::string& bucket, const std::string& prefix, Callback fn, DBErrorType* err) const;

public:
    CWalletDB();
    ~CWalletDB();

    CWalletDB(const CWalletDB&) = delete;
    CWalletDB& operator=(const CWalletDB&) = delete;

    /**
     * Open (or create) the database
     * @param path Directory for the LevelDB files
     * @param nCacheSize LevelDB block cache in bytes (0 = LevelDB default)
     */
    bool Open(const std::string& path, size_t nCacheSize = 0, DBErrorType* err = nullptr);
    void Close();
    bool IsOpen() const;

    bool Get(const std::string& bucket, const std::string& key, std::string& value, DBErrorType* err = nullptr) const;
    bool GetInt(const std::string& bucket, const std::string& key, uint64_t& value, DBErrorType* err = nullptr) const;

    /** Write one record, creating the bucket if needed */
    bool Put(const std::string& bucket, const std::string& key, const std::string& value, DBErrorType* err = nullptr);
    bool PutInt(const std::string& bucket, const std::string& key, uint64_t value, DBErrorType* err = nullptr);

    /** Delete one record; deleting a missing key in an existing bucket succeeds */
    bool Erase(const std::string& bucket, const std::string& key, DBErrorType* err = nullptr);

    bool HasKey(const std::string& bucket, const std::string& key) const;
    bool HasBucket(const std::string& bucket) const;

    /** Number of records whose key starts with prefix */
    bool Count(const std::string& bucket, const std::string& prefix, size_t& count, DBErrorType* err = nullptr) const;

    /** Values of the records whose key starts with prefix, in key order */
    bool GetStrings(const std::string& bucket, const std::string& prefix, std::vector<std::string>& values,
                    DBErrorType* err = nullptr) const;

    /** Every key of a bucket, in key order */
    bool KeyStrings(const std::string& bucket, std::vector<std::string>& keys, DBErrorType* err = nullptr) const;

    /**
     * Distinct leading string components of the bucket's keys (the bytes up
     * to the first NUL). A key without a NUL is INVALID_ARGUMENT.
     */
    bool GetPrefixes(const std::string& bucket, std::vector<std::string>& prefixes, DBErrorType* err = nullptr) const;

    /** Apply a batch atomically */
    bool WriteBatch(CWalletDBBatch& batch, DBErrorType* err = nullptr);

    /**
     * Set-of-strings records
     * RemoveFromSet erases the record when its last member goes.
     */
    bool AddToSet(const std::string& bucket, const std::string& key, const std::string& member, DBErrorType* err = nullptr);
    bool RemoveFromSet(const std::string& bucket, const std::string& key, const std::string& member, DBErrorType* err = nullptr);
    bool GetSetMembers(const std::string& bucket, const std::string& key, std::vector<std::string>& members,
                       DBErrorType* err = nullptr) const;
    bool SetContains(const std::string& bucket, const std::string& key, const std::string& member) const;

    /**
     * Coin mirror (bucket "coin", key = address + txid + index)
     */
    static std::string GetCoinKey(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex);
    bool WriteCoin(const CCoin& coin, DBErrorType* err = nullptr);
    bool EraseCoin(const CCoin& coin, DBErrorType* err = nullptr);
    bool LoadCoins(std::vector<CCoin>& coins, DBErrorType* err = nullptr) const;

    /**
     * Persist the coins a scan added and removed, in one batch.
     * Called after CTxProcessor::ProcessTransaction returns, so no registry
     * lock is held during the write.
     */
    bool MirrorScanResult(const CTxScanResult& result, DBErrorType* err = nullptr);
};

#endif // TALLY_WALLET_WALLETDB_H
