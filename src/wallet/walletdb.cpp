// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <wallet/walletdb.h>
#include <wallet/txprocessor.h>
#include <serialize.h>
#include <util/logging.h>

#include <leveldb/cache.h>
#include <leveldb/iterator.h>
#include <leveldb/options.h>

static const char DB_BUCKET = 'b';
static const char DB_RECORD = 'd';

static void SetError(DBErrorType* err, DBErrorType type) {
    if (err) *err = type;
}

static bool IsValidBucketName(const std::string& bucket) {
    return !bucket.empty() && bucket.find('\0') == std::string::npos;
}

static std::string BucketMarkerKey(const std::string& bucket) {
    std::string key;
    key.reserve(1 + bucket.size());
    key.push_back(DB_BUCKET);
    key.append(bucket);
    return key;
}

static std::string RecordPrefix(const std::string& bucket) {
    std::string key;
    key.reserve(2 + bucket.size());
    key.push_back(DB_RECORD);
    key.append(bucket);
    key.push_back('\0');
    return key;
}

// ============================================================================
// Key and value encoding
// ============================================================================

CDBKey& CDBKey::PushInt(uint64_t n) {
    m_key.append(EncodeDBInt(n));
    return *this;
}

CDBKey& CDBKey::PushString(const std::string& str) {
    m_key.append(str);
    m_key.push_back('\0');
    return *this;
}

CDBKey& CDBKey::PushBytes(const std::vector<uint8_t>& vch) {
    return PushBytes(vch.data(), vch.size());
}

CDBKey& CDBKey::PushBytes(const uint8_t* data, size_t len) {
    m_key.append(reinterpret_cast<const char*>(data), len);
    return *this;
}

std::string EncodeDBInt(uint64_t n) {
    std::vector<uint8_t> data;
    WriteUint64LE(data, n);
    return std::string(data.begin(), data.end());
}

bool DecodeDBInt(const std::string& value, uint64_t& n) {
    if (value.size() != 8) {
        return false;
    }
    CDataReader reader(reinterpret_cast<const uint8_t*>(value.data()), value.size());
    return reader.ReadUint64LE(n);
}

std::string EncodeStringSet(const std::set<std::string>& members) {
    std::vector<uint8_t> data;
    WriteCompactSize(data, members.size());
    for (const std::string& member : members) {
        WriteCompactSize(data, member.size());
        data.insert(data.end(), member.begin(), member.end());
    }
    return std::string(data.begin(), data.end());
}

bool DecodeStringSet(const std::string& value, std::set<std::string>& members) {
    CDataReader reader(reinterpret_cast<const uint8_t*>(value.data()), value.size());

    uint64_t count;
    if (!reader.ReadCompactSize(count) || count > reader.Remaining()) {
        return false;
    }

    std::set<std::string> result;
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t len;
        std::vector<uint8_t> member;
        if (!reader.ReadCompactSize(len) || len > reader.Remaining() ||
            !reader.ReadBytes(static_cast<size_t>(len), member)) {
            return false;
        }
        result.insert(std::string(member.begin(), member.end()));
    }

    if (!reader.IsEmpty()) {
        return false;
    }

    members.swap(result);
    return true;
}

// ============================================================================
// Batch
// ============================================================================

bool CWalletDBBatch::Put(const std::string& bucket, const std::string& key, const std::string& value) {
    if (!IsValidBucketName(bucket)) {
        return false;
    }
    m_batch.Put(BucketMarkerKey(bucket), leveldb::Slice());
    m_batch.Put(RecordPrefix(bucket) + key, value);
    m_nOps++;
    return true;
}

bool CWalletDBBatch::Erase(const std::string& bucket, const std::string& key) {
    if (!IsValidBucketName(bucket)) {
        return false;
    }
    m_batch.Delete(RecordPrefix(bucket) + key);
    m_nOps++;
    return true;
}

// ============================================================================
// Database Management
// ============================================================================

CWalletDB::CWalletDB() : db(nullptr) {
}

CWalletDB::~CWalletDB() {
    Close();
}

bool CWalletDB::Open(const std::string& path, size_t nCacheSize, DBErrorType* err) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        SetError(err, DBErrorType::OK);
        return true;  // Already open
    }

    leveldb::Options options;
    options.create_if_missing = true;
    options.compression = leveldb::kSnappyCompression;
    options.write_buffer_size = 4 * 1024 * 1024;
    // LevelDB does not take ownership of the block cache
    std::unique_ptr<leveldb::Cache> cache;
    if (nCacheSize > 0) {
        cache.reset(leveldb::NewLRUCache(nCacheSize));
        options.block_cache = cache.get();
    }

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path, &raw_db);
    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        SetError(err, type);
        LogPrintDB(ERROR, "CWalletDB::Open: %s: %s", path.c_str(), GetDBErrorMessage(status, type).c_str());
        return false;
    }

    m_cache = std::move(cache);
    db.reset(raw_db);
    m_path = path;
    SetError(err, DBErrorType::OK);
    LogPrintDB(INFO, "Opened wallet database %s", path.c_str());
    return true;
}

void CWalletDB::Close() {
    std::lock_guard<std::mutex> lock(cs_db);

    if (db != nullptr) {
        LogPrintDB(INFO, "Closing wallet database %s", m_path.c_str());
    }
    db.reset();
    m_cache.reset();
    m_path.clear();
}

bool CWalletDB::IsOpen() const {
    std::lock_guard<std::mutex> lock(cs_db);
    return db != nullptr;
}

// ============================================================================
// Internal helpers (cs_db held)
// ============================================================================

bool CWalletDB::CheckOpen(DBErrorType* err) const {
    if (db == nullptr) {
        SetError(err, DBErrorType::NOT_OPEN);
        LogPrintDB(ERROR, "CWalletDB: database not open");
        return false;
    }
    return true;
}

bool CWalletDB::BucketExistsUnlocked(const std::string& bucket) const {
    std::string value;
    return db->Get(leveldb::ReadOptions(), BucketMarkerKey(bucket), &value).ok();
}

bool CWalletDB::ReadUnlocked(const std::string& bucket, const std::string& key, std::string& value,
                             DBErrorType* err) const {
    if (!CheckOpen(err)) {
        return false;
    }
    if (!IsValidBucketName(bucket)) {
        SetError(err, DBErrorType::INVALID_ARGUMENT);
        return false;
    }

    leveldb::Status status = db->Get(leveldb::ReadOptions(), RecordPrefix(bucket) + key, &value);
    if (status.IsNotFound()) {
        SetError(err, BucketExistsUnlocked(bucket) ? DBErrorType::NOT_FOUND : DBErrorType::BUCKET_NOT_FOUND);
        return false;
    }
    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        SetError(err, type);
        LogPrintDB(ERROR, "CWalletDB: read %s failed: %s", bucket.c_str(), GetDBErrorMessage(status, type).c_str());
        return false;
    }

    SetError(err, DBErrorType::OK);
    return true;
}

bool CWalletDB::WriteUnlocked(leveldb::WriteBatch& batch, DBErrorType* err, const char* what) {
    if (!CheckOpen(err)) {
        return false;
    }

    leveldb::WriteOptions options;
    options.sync = true;
    leveldb::Status status = db->Write(options, &batch);
    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        SetError(err, type);
        LogPrintDB(ERROR, "CWalletDB: %s failed: %s", what, GetDBErrorMessage(status, type).c_str());
        return false;
    }

    SetError(err, DBErrorType::OK);
    return true;
}

template <typename Callback>
bool CWalletDB::ForEachUnlocked(const std::string& bucket, const std::string& prefix, Callback fn,
                                DBErrorType* err) const {
    if (!CheckOpen(err)) {
        return false;
    }
    if (!IsValidBucketName(bucket)) {
        SetError(err, DBErrorType::INVALID_ARGUMENT);
        return false;
    }
    if (!BucketExistsUnlocked(bucket)) {
        SetError(err, DBErrorType::BUCKET_NOT_FOUND);
        return false;
    }

    const std::string bucketPrefix = RecordPrefix(bucket);
    const std::string seek = bucketPrefix + prefix;

    std::unique_ptr<leveldb::Iterator> it(db->NewIterator(leveldb::ReadOptions()));
    for (it->Seek(seek); it->Valid(); it->Next()) {
        leveldb::Slice k = it->key();
        if (!k.starts_with(seek)) {
            break;
        }
        k.remove_prefix(bucketPrefix.size());
        if (!fn(k.ToString(), it->value().ToString())) {
            SetError(err, DBErrorType::INVALID_ARGUMENT);
            return false;
        }
    }

    leveldb::Status status = it->status();
    if (!status.ok()) {
        DBErrorType type = ClassifyDBError(status);
        SetError(err, type);
        LogPrintDB(ERROR, "CWalletDB: scan of %s failed: %s", bucket.c_str(), GetDBErrorMessage(status, type).c_str());
        return false;
    }

    SetError(err, DBErrorType::OK);
    return true;
}

// ============================================================================
// Records
// ============================================================================

bool CWalletDB::Get(const std::string& bucket, const std::string& key, std::string& value, DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);
    return ReadUnlocked(bucket, key, value, err);
}

bool CWalletDB::GetInt(const std::string& bucket, const std::string& key, uint64_t& value, DBErrorType* err) const {
    std::string data;
    if (!Get(bucket, key, data, err)) {
        return false;
    }
    if (!DecodeDBInt(data, value)) {
        SetError(err, DBErrorType::CORRUPTION);
        LogPrintDB(ERROR, "CWalletDB: %s record is not an 8-byte integer (%zu bytes)", bucket.c_str(), data.size());
        return false;
    }
    return true;
}

bool CWalletDB::Put(const std::string& bucket, const std::string& key, const std::string& value, DBErrorType* err) {
    CWalletDBBatch batch;
    if (!batch.Put(bucket, key, value)) {
        SetError(err, DBErrorType::INVALID_ARGUMENT);
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_db);
    return WriteUnlocked(batch.m_batch, err, "put");
}

bool CWalletDB::PutInt(const std::string& bucket, const std::string& key, uint64_t value, DBErrorType* err) {
    return Put(bucket, key, EncodeDBInt(value), err);
}

bool CWalletDB::Erase(const std::string& bucket, const std::string& key, DBErrorType* err) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (!CheckOpen(err)) {
        return false;
    }
    if (!IsValidBucketName(bucket)) {
        SetError(err, DBErrorType::INVALID_ARGUMENT);
        return false;
    }
    if (!BucketExistsUnlocked(bucket)) {
        SetError(err, DBErrorType::BUCKET_NOT_FOUND);
        return false;
    }

    leveldb::WriteBatch batch;
    batch.Delete(RecordPrefix(bucket) + key);
    return WriteUnlocked(batch, err, "erase");
}

bool CWalletDB::HasKey(const std::string& bucket, const std::string& key) const {
    std::lock_guard<std::mutex> lock(cs_db);
    std::string value;
    DBErrorType err;
    return ReadUnlocked(bucket, key, value, &err);
}

bool CWalletDB::HasBucket(const std::string& bucket) const {
    std::lock_guard<std::mutex> lock(cs_db);
    if (db == nullptr || !IsValidBucketName(bucket)) {
        return false;
    }
    return BucketExistsUnlocked(bucket);
}

bool CWalletDB::Count(const std::string& bucket, const std::string& prefix, size_t& count, DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);

    size_t n = 0;
    bool ok = ForEachUnlocked(bucket, prefix, [&n](const std::string&, const std::string&) {
        n++;
        return true;
    }, err);
    if (ok) {
        count = n;
    }
    return ok;
}

bool CWalletDB::GetStrings(const std::string& bucket, const std::string& prefix, std::vector<std::string>& values,
                           DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);

    std::vector<std::string> result;
    bool ok = ForEachUnlocked(bucket, prefix, [&result](const std::string&, const std::string& value) {
        result.push_back(value);
        return true;
    }, err);
    if (ok) {
        values.swap(result);
    }
    return ok;
}

bool CWalletDB::KeyStrings(const std::string& bucket, std::vector<std::string>& keys, DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);

    std::vector<std::string> result;
    bool ok = ForEachUnlocked(bucket, std::string(), [&result](const std::string& key, const std::string&) {
        result.push_back(key);
        return true;
    }, err);
    if (ok) {
        keys.swap(result);
    }
    return ok;
}

bool CWalletDB::GetPrefixes(const std::string& bucket, std::vector<std::string>& prefixes, DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);

    std::vector<std::string> result;
    std::string last;
    bool fHaveLast = false;
    bool ok = ForEachUnlocked(bucket, std::string(), [&](const std::string& key, const std::string&) {
        // Keys are sorted, so records sharing a prefix are adjacent
        if (fHaveLast && key.size() > last.size() && key.compare(0, last.size(), last) == 0 &&
            key[last.size()] == '\0') {
            return true;
        }
        size_t pos = key.find('\0');
        if (pos == std::string::npos) {
            LogPrintDB(ERROR, "CWalletDB: key in %s has no string prefix", bucket.c_str());
            return false;
        }
        last = key.substr(0, pos);
        fHaveLast = true;
        result.push_back(last);
        return true;
    }, err);
    if (ok) {
        prefixes.swap(result);
    }
    return ok;
}

bool CWalletDB::WriteBatch(CWalletDBBatch& batch, DBErrorType* err) {
    std::lock_guard<std::mutex> lock(cs_db);

    if (batch.IsEmpty()) {
        if (!CheckOpen(err)) {
            return false;
        }
        SetError(err, DBErrorType::OK);
        return true;
    }
    if (!WriteUnlocked(batch.m_batch, err, "batch write")) {
        return false;
    }
    LogPrintDB(DEBUG, "CWalletDB: wrote batch of %zu operations", batch.Size());
    return true;
}

// ============================================================================
// Set-of-strings records
// ============================================================================

bool CWalletDB::AddToSet(const std::string& bucket, const std::string& key, const std::string& member,
                         DBErrorType* err) {
    std::lock_guard<std::mutex> lock(cs_db);

    std::set<std::string> members;
    std::string value;
    DBErrorType readErr;
    if (ReadUnlocked(bucket, key, value, &readErr)) {
        if (!DecodeStringSet(value, members)) {
            SetError(err, DBErrorType::CORRUPTION);
            LogPrintDB(ERROR, "CWalletDB: set record in %s is corrupt", bucket.c_str());
            return false;
        }
    } else if (!IsRecoverableError(readErr)) {
        SetError(err, readErr);
        return false;
    }

    members.insert(member);

    CWalletDBBatch batch;
    batch.Put(bucket, key, EncodeStringSet(members));
    return WriteUnlocked(batch.m_batch, err, "set add");
}

bool CWalletDB::RemoveFromSet(const std::string& bucket, const std::string& key, const std::string& member,
                              DBErrorType* err) {
    std::lock_guard<std::mutex> lock(cs_db);

    std::string value;
    if (!ReadUnlocked(bucket, key, value, err)) {
        return false;
    }

    std::set<std::string> members;
    if (!DecodeStringSet(value, members)) {
        SetError(err, DBErrorType::CORRUPTION);
        LogPrintDB(ERROR, "CWalletDB: set record in %s is corrupt", bucket.c_str());
        return false;
    }

    members.erase(member);

    CWalletDBBatch batch;
    if (members.empty()) {
        batch.Erase(bucket, key);
    } else {
        batch.Put(bucket, key, EncodeStringSet(members));
    }
    return WriteUnlocked(batch.m_batch, err, "set remove");
}

bool CWalletDB::GetSetMembers(const std::string& bucket, const std::string& key, std::vector<std::string>& members,
                              DBErrorType* err) const {
    std::lock_guard<std::mutex> lock(cs_db);

    std::string value;
    if (!ReadUnlocked(bucket, key, value, err)) {
        return false;
    }

    std::set<std::string> decoded;
    if (!DecodeStringSet(value, decoded)) {
        SetError(err, DBErrorType::CORRUPTION);
        LogPrintDB(ERROR, "CWalletDB: set record in %s is corrupt", bucket.c_str());
        return false;
    }

    members.assign(decoded.begin(), decoded.end());
    return true;
}

bool CWalletDB::SetContains(const std::string& bucket, const std::string& key, const std::string& member) const {
    std::vector<std::string> members;
    DBErrorType err;
    if (!GetSetMembers(bucket, key, members, &err)) {
        return false;
    }
    for (const std::string& m : members) {
        if (m == member) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Coin mirror
// ============================================================================

std::string CWalletDB::GetCoinKey(const std::vector<uint8_t>& vchAddr, const uint256& txid, uint32_t nIndex) {
    return CDBKey().PushBytes(vchAddr).PushBytes(txid.begin(), 32).PushInt(nIndex).str();
}

bool CWalletDB::WriteCoin(const CCoin& coin, DBErrorType* err) {
    std::vector<uint8_t> data = coin.Serialize();
    return Put(COIN_BUCKET, GetCoinKey(coin.vchAddr, coin.txid, coin.nIndex),
               std::string(data.begin(), data.end()), err);
}

bool CWalletDB::EraseCoin(const CCoin& coin, DBErrorType* err) {
    return Erase(COIN_BUCKET, GetCoinKey(coin.vchAddr, coin.txid, coin.nIndex), err);
}

bool CWalletDB::LoadCoins(std::vector<CCoin>& coins, DBErrorType* err) const {
    std::vector<std::string> values;
    DBErrorType readErr;
    if (!GetStrings(COIN_BUCKET, std::string(), values, &readErr)) {
        if (readErr == DBErrorType::BUCKET_NOT_FOUND) {
            // Fresh database
            coins.clear();
            SetError(err, DBErrorType::OK);
            return true;
        }
        SetError(err, readErr);
        return false;
    }

    std::vector<CCoin> result;
    result.reserve(values.size());
    for (const std::string& value : values) {
        CCoin coin;
        std::string error;
        if (!coin.Deserialize(std::vector<uint8_t>(value.begin(), value.end()), &error)) {
            SetError(err, DBErrorType::CORRUPTION);
            LogPrintDB(ERROR, "CWalletDB: bad coin record: %s", error.c_str());
            return false;
        }
        result.push_back(coin);
    }

    coins.swap(result);
    SetError(err, DBErrorType::OK);
    LogPrintDB(DEBUG, "CWalletDB: loaded %zu coins", coins.size());
    return true;
}

bool CWalletDB::MirrorScanResult(const CTxScanResult& result, DBErrorType* err) {
    CWalletDBBatch batch;

    for (const CCoin& coin : result.GetRemovedCoins()) {
        batch.Erase(COIN_BUCKET, GetCoinKey(coin.vchAddr, coin.txid, coin.nIndex));
    }
    for (const CCoin& coin : result.GetAddedCoins()) {
        std::vector<uint8_t> data = coin.Serialize();
        batch.Put(COIN_BUCKET, GetCoinKey(coin.vchAddr, coin.txid, coin.nIndex),
                  std::string(data.begin(), data.end()));
    }

    return WriteBatch(batch, err);
}
