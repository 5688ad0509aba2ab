// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }

    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }

    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }

    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }

    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }

    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }

    return DBErrorType::UNKNOWN;
}

bool IsRecoverableError(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
        case DBErrorType::NOT_FOUND:
        case DBErrorType::BUCKET_NOT_FOUND:
            return true;

        case DBErrorType::CORRUPTION:
        case DBErrorType::IO_ERROR:
        case DBErrorType::INVALID_ARGUMENT:
        case DBErrorType::NOT_SUPPORTED:
        case DBErrorType::NOT_OPEN:
        case DBErrorType::UNKNOWN:
            return false;
    }
    return false;
}

const char* GetDBErrorName(DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:               return "OK";
        case DBErrorType::CORRUPTION:       return "CORRUPTION";
        case DBErrorType::IO_ERROR:         return "IO_ERROR";
        case DBErrorType::NOT_FOUND:        return "NOT_FOUND";
        case DBErrorType::BUCKET_NOT_FOUND: return "BUCKET_NOT_FOUND";
        case DBErrorType::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case DBErrorType::NOT_SUPPORTED:    return "NOT_SUPPORTED";
        case DBErrorType::NOT_OPEN:         return "NOT_OPEN";
        case DBErrorType::UNKNOWN:          return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
            return "Success";
        case DBErrorType::CORRUPTION:
            return "Database corruption detected: " + status.ToString() +
                   " (remove the wallet database to rebuild it)";
        case DBErrorType::IO_ERROR:
            return "I/O error: " + status.ToString() + " (check disk space and permissions)";
        case DBErrorType::NOT_FOUND:
            return "Key not found";
        case DBErrorType::BUCKET_NOT_FOUND:
            return "Bucket not found";
        case DBErrorType::INVALID_ARGUMENT:
            return "Invalid argument: " + status.ToString();
        case DBErrorType::NOT_SUPPORTED:
            return "Operation not supported: " + status.ToString();
        case DBErrorType::NOT_OPEN:
            return "Database not open";
        case DBErrorType::UNKNOWN:
            return "Unknown database error: " + status.ToString();
    }
    return "Unknown database error";
}
