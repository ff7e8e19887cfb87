// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STORAGE_BACKEND_H
#define ARTDNA_STORAGE_BACKEND_H

/**
 * Session storage backend interface.
 *
 * Every backend keeps two namespaces: live sessions and archived
 * sessions. Records are stored as the sealed binary envelope from
 * dna_serialization.h, so a record that fails its checksum is detected
 * on read. Listings skip such records (logged at WARN); a direct load of
 * one returns nullopt.
 *
 * Backends are not thread-safe on their own; StorageManager serializes
 * access.
 */

#include <art_dna/dna_types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace art_dna {

class IStorageBackend {
public:
    virtual ~IStorageBackend() = default;

    /**
     * Open or create the underlying store.
     * @throws BackendUnavailable on failure
     */
    virtual void initialize() = 0;

    /** Insert or replace a live session */
    virtual void save_session(const DNASession& session) = 0;
    virtual std::optional<DNASession> load_session(const std::string& session_id) = 0;

    /** @return true if a live session was removed */
    virtual bool delete_session(const std::string& session_id) = 0;

    /** Live sessions in start order */
    virtual std::vector<DNASession> list_sessions() = 0;

    /** Live sessions of one artist, in start order */
    virtual std::vector<DNASession> list_sessions_by_artist(const std::string& artist_id);

    /**
     * Move a live session into the archive namespace.
     * @return false (no-op) if the id is unknown
     */
    virtual bool archive_session(const std::string& session_id) = 0;

    virtual std::optional<DNASession> load_archived_session(const std::string& session_id) = 0;
    virtual std::vector<DNASession> list_archived_sessions() = 0;

    /** Remove everything, live and archived */
    virtual void clear() = 0;

    /** Encoded size of every live record, in bytes */
    virtual uint64_t stored_bytes() = 0;

    virtual std::string name() const = 0;
};

/**
 * Decode one stored record. A record that fails to decode is logged at
 * WARN under its key and yields nullopt.
 */
std::optional<DNASession> DecodeSessionRecord(const std::vector<uint8_t>& record, const std::string& key);

/** Stable sort by started_at, then session id */
void SortByStartTime(std::vector<DNASession>& sessions);

} // namespace art_dna

#endif // ARTDNA_STORAGE_BACKEND_H
