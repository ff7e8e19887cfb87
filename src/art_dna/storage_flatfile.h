// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STORAGE_FLATFILE_H
#define ARTDNA_STORAGE_FLATFILE_H

/**
 * Flat key-value file backend.
 *
 * Keys are "session_<id>" and "archive_<id>". The whole keyspace is
 * loaded at initialize() and every mutation rewrites the file
 * synchronously: the new contents go to "<path>.tmp", which is then
 * renamed over the old file. A failed write leaves both the file and the
 * in-memory keyspace unchanged.
 *
 * File layout (little-endian):
 *   magic "ADNF" | version u8 | count u32
 *   count x { key_len u16 | key | value_len u32 | value }
 */

#include <art_dna/storage_backend.h>

#include <map>

namespace art_dna {

class FlatFileStorageBackend : public IStorageBackend {
public:
    explicit FlatFileStorageBackend(std::string path);

    void initialize() override;
    void save_session(const DNASession& session) override;
    std::optional<DNASession> load_session(const std::string& session_id) override;
    bool delete_session(const std::string& session_id) override;
    std::vector<DNASession> list_sessions() override;
    bool archive_session(const std::string& session_id) override;
    std::optional<DNASession> load_archived_session(const std::string& session_id) override;
    std::vector<DNASession> list_archived_sessions() override;
    void clear() override;
    uint64_t stored_bytes() override;
    std::string name() const override { return "flatfile"; }

    const std::string& path() const { return m_path; }

private:
    using KeyMap = std::map<std::string, std::vector<uint8_t>>;

    static constexpr uint8_t FILE_MAGIC[4] = {0x41, 0x44, 0x4E, 0x46};  // "ADNF"
    static constexpr uint8_t FILE_VERSION = 0x01;

    static const std::string SESSION_PREFIX;  // "session_"
    static const std::string ARCHIVE_PREFIX;  // "archive_"

    void load_file();
    void write_file(const KeyMap& entries) const;

    /** Persist the new keyspace, then adopt it */
    void commit(KeyMap next);

    std::optional<DNASession> get(const std::string& key) const;
    std::vector<DNASession> list_prefix(const std::string& prefix) const;

    std::string m_path;
    KeyMap m_entries;
};

} // namespace art_dna

#endif // ARTDNA_STORAGE_FLATFILE_H
