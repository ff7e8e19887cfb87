// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STORAGE_MEMORY_H
#define ARTDNA_STORAGE_MEMORY_H

#include <art_dna/storage_backend.h>

#include <map>

namespace art_dna {

/** Volatile in-process backend, for tests and throwaway sessions */
class MemoryStorageBackend : public IStorageBackend {
public:
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
    std::string name() const override { return "memory"; }

    /** Overwrite a stored record's bytes (for corruption tests) */
    void put_raw(const std::string& session_id, std::vector<uint8_t> record);

private:
    using RecordMap = std::map<std::string, std::vector<uint8_t>>;

    static std::vector<DNASession> decode_all(const RecordMap& records, const std::string& ns);

    RecordMap m_sessions;
    RecordMap m_archives;
};

} // namespace art_dna

#endif // ARTDNA_STORAGE_MEMORY_H
