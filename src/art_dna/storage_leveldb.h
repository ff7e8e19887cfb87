// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STORAGE_LEVELDB_H
#define ARTDNA_STORAGE_LEVELDB_H

/**
 * Durable indexed session store on LevelDB.
 *
 * Key format:
 *   "session:" + id                          -> sealed session record
 *   "idx_time:" + started_at (20 digits) + ":" + id -> id
 *   "idx_artist:" + artist_id + ":" + id     -> id
 *   "archive:" + id                          -> sealed session record
 *
 * Saves, deletes and archive moves are single WriteBatch writes, so a
 * record and its index entries change together. Any non-NotFound status
 * is classified with ClassifyDBError, logged, and raised as
 * BackendUnavailable.
 */

#include <art_dna/storage_backend.h>

#include <leveldb/db.h>

#include <memory>

namespace leveldb {
class WriteBatch;
}

namespace art_dna {

class LevelDBStorageBackend : public IStorageBackend {
public:
    explicit LevelDBStorageBackend(std::string path);
    ~LevelDBStorageBackend();

    LevelDBStorageBackend(const LevelDBStorageBackend&) = delete;
    LevelDBStorageBackend& operator=(const LevelDBStorageBackend&) = delete;

    void initialize() override;
    void save_session(const DNASession& session) override;
    std::optional<DNASession> load_session(const std::string& session_id) override;
    bool delete_session(const std::string& session_id) override;
    std::vector<DNASession> list_sessions() override;
    std::vector<DNASession> list_sessions_by_artist(const std::string& artist_id) override;
    bool archive_session(const std::string& session_id) override;
    std::optional<DNASession> load_archived_session(const std::string& session_id) override;
    std::vector<DNASession> list_archived_sessions() override;
    void clear() override;
    uint64_t stored_bytes() override;
    std::string name() const override { return "leveldb"; }

    void Close();

private:
    static const std::string SESSION_PREFIX;     // "session:"
    static const std::string TIME_INDEX_PREFIX;  // "idx_time:"
    static const std::string ARTIST_INDEX_PREFIX; // "idx_artist:"
    static const std::string ARCHIVE_PREFIX;     // "archive:"

    static std::string make_time_key(int64_t started_at, const std::string& session_id);
    static std::string make_artist_key(const std::string& artist_id, const std::string& session_id);

    leveldb::DB& db(const std::string& operation) const;

    /** Raw read; nullopt on NotFound, throws on any other failure */
    std::optional<std::string> get_raw(const std::string& key, const std::string& operation) const;

    void write(leveldb::WriteBatch& batch, const std::string& operation);
    void check(const leveldb::Status& status, const std::string& operation) const;

    /** Queue deletion of the index entries of a stored record, if it decodes */
    void unindex(leveldb::WriteBatch& batch, const std::string& session_id, const std::string& record) const;

    /** Collect "<prefix>...": value pairs in key order */
    std::vector<std::pair<std::string, std::string>> scan(const std::string& prefix, const std::string& operation) const;

    /** Resolve index entries (value = session id) to live sessions */
    std::vector<DNASession> resolve_index(const std::string& prefix, const std::string& operation) const;

    std::string m_path;
    std::unique_ptr<leveldb::DB> m_db;
};

} // namespace art_dna

#endif // ARTDNA_STORAGE_LEVELDB_H
