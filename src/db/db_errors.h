// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_DB_DB_ERRORS_H
#define ARTDNA_DB_DB_ERRORS_H

#include <leveldb/status.h>
#include <string>

/**
 * Session database error classification
 *
 * Maps LevelDB statuses onto a small set of error types so the
 * storage layer can log an actionable message before raising.
 */

enum class DBErrorType {
    OK,                    // No error
    CORRUPTION,            // Data corruption detected
    IO_ERROR,              // Disk full, permission denied, lock held, ...
    NOT_FOUND,             // Key not found (normal for lookups)
    INVALID_ARGUMENT,      // Invalid argument passed to DB operation
    NOT_SUPPORTED,         // Operation not supported
    UNKNOWN
};

/**
 * Classify LevelDB status into error type
 */
DBErrorType ClassifyDBError(const leveldb::Status& status);

/**
 * Get human-readable error message
 *
 * @param status LevelDB status
 * @param error_type Classified error type
 */
std::string GetDBErrorMessage(const leveldb::Status& status, DBErrorType error_type);

#endif // ARTDNA_DB_DB_ERRORS_H
