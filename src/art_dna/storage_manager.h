// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#ifndef ARTDNA_STORAGE_MANAGER_H
#define ARTDNA_STORAGE_MANAGER_H

/**
 * Session persistence front end.
 *
 * Picks a backend from DNAConfig::storage_mode, serializes access to it
 * and keeps a small most-recently-used cache of live sessions (at most
 * max_sessions_in_memory entries). Every operation before initialize()
 * throws BackendUnavailable. Storage errors propagate; there is no
 * built-in retry.
 */

#include <art_dna/dna_config.h>
#include <art_dna/storage_backend.h>

#include <list>
#include <map>
#include <memory>
#include <mutex>

namespace art_dna {

struct StorageStats {
    size_t total_sessions{0};
    uint64_t total_strokes{0};
    uint64_t storage_size_bytes{0};
};

class StorageManager {
public:
    /** Backend chosen by config.storage_mode */
    explicit StorageManager(const DNAConfig& config);

    /** Use an explicit backend (tests, embedding applications) */
    StorageManager(const DNAConfig& config, std::unique_ptr<IStorageBackend> backend);

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    /** Backend factory for a storage mode */
    static std::unique_ptr<IStorageBackend> CreateBackend(const DNAConfig& config);

    /** @throws BackendUnavailable if the backend cannot be opened */
    void initialize();
    bool is_initialized() const;

    void save_session(const DNASession& session);
    std::optional<DNASession> load_session(const std::string& session_id);
    bool delete_session(const std::string& session_id);
    std::vector<DNASession> list_sessions();
    std::vector<DNASession> list_sessions_by_artist(const std::string& artist_id);

    /** @return false if the session is not live */
    bool archive_session(const std::string& session_id);

    /**
     * Archive every live session that started more than `days` days
     * before now_ms.
     * @return number of sessions moved
     */
    size_t archive_old_sessions(int days, int64_t now_ms);

    std::optional<DNASession> load_archived_session(const std::string& session_id);
    std::vector<DNASession> list_archived_sessions();

    void clear();

    StorageStats get_stats();

    std::string backend_name() const;
    size_t cached_sessions() const;

private:
    void require_initialized(const char* operation) const;
    void cache_put(const DNASession& session);
    void cache_erase(const std::string& session_id);
    std::optional<DNASession> cache_get(const std::string& session_id);

    std::unique_ptr<IStorageBackend> m_backend;
    const size_t m_max_cached;
    bool m_initialized{false};

    // Front of the list is the most recently used id
    std::list<std::string> m_lru;
    std::map<std::string, std::pair<DNASession, std::list<std::string>::iterator>> m_cache;

    mutable std::mutex m_mutex;
};

} // namespace art_dna

#endif // ARTDNA_STORAGE_MANAGER_H
