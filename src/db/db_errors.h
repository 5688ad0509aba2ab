// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_DB_DB_ERRORS_H
#define TALLY_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Database error classification
 *
 * LevelDB reports failures as a leveldb::Status; the wallet store maps them
 * onto DBErrorType so callers can branch on the kind of failure without
 * parsing status strings.
 */
enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // I/O error (disk full, permission denied, etc.)
    NOT_FOUND,             // Key not found (normal for some operations)
    BUCKET_NOT_FOUND,      // Bucket was never written
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    NOT_OPEN,              // Store used before Open() or after Close()
    UNKNOWN                // Unknown error type
};

/**
 * Classify LevelDB status into error type
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Check if error is recoverable (missing keys and buckets are expected)
 */
bool IsRecoverableError(DBErrorType error_type);

/**
 * Short name for logs ("CORRUPTION", "BUCKET_NOT_FOUND", ...)
 */
const char* GetDBErrorName(DBErrorType error_type);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

#endif // TALLY_DB_DB_ERRORS_H
