// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <db/db_errors.h>

DBErrorType ClassifyDBError(const leveldb::Status& status) {
    if (status.ok()) {
        return DBErrorType::OK;
    }
    if (status.IsNotFound()) {
        return DBErrorType::NOT_FOUND;
    }
    if (status.IsCorruption()) {
        return DBErrorType::CORRUPTION;
    }
    if (status.IsIOError()) {
        return DBErrorType::IO_ERROR;
    }
    if (status.IsInvalidArgument()) {
        return DBErrorType::INVALID_ARGUMENT;
    }
    if (status.IsNotSupportedError()) {
        return DBErrorType::NOT_SUPPORTED;
    }
    return DBErrorType::UNKNOWN;
}

std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type) {
    switch (error_type) {
        case DBErrorType::OK:
            return "Success";
        case DBErrorType::CORRUPTION:
            return "Session database corruption detected: " + status.ToString() +
                   " (remove the storage directory to start fresh)";
        case DBErrorType::IO_ERROR:
            return "I/O error: " + status.ToString() +
                   " (check disk space, permissions and that no other process holds the lock)";
        case DBErrorType::NOT_FOUND:
            return "Session not found";
        case DBErrorType::INVALID_ARGUMENT:
            return "Invalid argument: " + status.ToString();
        case DBErrorType::NOT_SUPPORTED:
            return "Operation not supported: " + status.ToString();
        case DBErrorType::UNKNOWN:
            break;
    }
    return "Unknown database error: " + status.ToString();
}
