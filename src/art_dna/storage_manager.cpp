// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/storage_manager.h>

#include <art_dna/dna_errors.h>
#include <art_dna/storage_flatfile.h>
#include <art_dna/storage_leveldb.h>
#include <art_dna/storage_memory.h>
#include <util/logging.h>

namespace art_dna {

static constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

std::unique_ptr<IStorageBackend> StorageManager::CreateBackend(const DNAConfig& config) {
    switch (config.storage_mode) {
        case StorageMode::LEVELDB:
            return std::unique_ptr<IStorageBackend>(new LevelDBStorageBackend(
                config.storage_path.empty() ? "sessions" : config.storage_path));
        case StorageMode::FLATFILE:
            return std::unique_ptr<IStorageBackend>(new FlatFileStorageBackend(
                config.storage_path.empty() ? "sessions.dat" : config.storage_path));
        case StorageMode::MEMORY:
            return std::unique_ptr<IStorageBackend>(new MemoryStorageBackend());
    }
    return std::unique_ptr<IStorageBackend>(new MemoryStorageBackend());
}

StorageManager::StorageManager(const DNAConfig& config)
    : StorageManager(config, CreateBackend(config)) {}

StorageManager::StorageManager(const DNAConfig& config, std::unique_ptr<IStorageBackend> backend)
    : m_backend(std::move(backend)), m_max_cached(config.max_sessions_in_memory) {}

void StorageManager::initialize() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_initialized) return;
    m_backend->initialize();
    m_initialized = true;
    LogPrintStorage(INFO, "DNA storage initialized (mode: %s)", m_backend->name().c_str());
}

bool StorageManager::is_initialized() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_initialized;
}

void StorageManager::require_initialized(const char* operation) const {
    if (!m_initialized) {
        throw BackendUnavailable(std::string("Storage not initialized (") + operation + ")");
    }
}

void StorageManager::cache_put(const DNASession& session) {
    if (m_max_cached == 0) return;

    auto it = m_cache.find(session.session_id);
    if (it != m_cache.end()) {
        m_lru.erase(it->second.second);
        m_cache.erase(it);
    }
    m_lru.push_front(session.session_id);
    m_cache.emplace(session.session_id, std::make_pair(session, m_lru.begin()));

    while (m_cache.size() > m_max_cached) {
        m_cache.erase(m_lru.back());
        m_lru.pop_back();
    }
}

void StorageManager::cache_erase(const std::string& session_id) {
    auto it = m_cache.find(session_id);
    if (it == m_cache.end()) return;
    m_lru.erase(it->second.second);
    m_cache.erase(it);
}

std::optional<DNASession> StorageManager::cache_get(const std::string& session_id) {
    auto it = m_cache.find(session_id);
    if (it == m_cache.end()) return std::nullopt;
    m_lru.splice(m_lru.begin(), m_lru, it->second.second);
    return it->second.first;
}

void StorageManager::save_session(const DNASession& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("save_session");
    m_backend->save_session(session);
    cache_put(session);
    LogPrintStorage(DEBUG, "Session saved: %s (%llu strokes)", session.session_id.c_str(),
                    static_cast<unsigned long long>(session.total_strokes));
}

std::optional<DNASession> StorageManager::load_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("load_session");

    std::optional<DNASession> session = cache_get(session_id);
    if (session) return session;

    session = m_backend->load_session(session_id);
    if (session) {
        cache_put(*session);
        LogPrintStorage(DEBUG, "Session loaded: %s", session_id.c_str());
    }
    return session;
}

bool StorageManager::delete_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("delete_session");
    cache_erase(session_id);
    bool removed = m_backend->delete_session(session_id);
    if (removed) LogPrintStorage(DEBUG, "Session deleted: %s", session_id.c_str());
    return removed;
}

std::vector<DNASession> StorageManager::list_sessions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("list_sessions");
    return m_backend->list_sessions();
}

std::vector<DNASession> StorageManager::list_sessions_by_artist(const std::string& artist_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("list_sessions_by_artist");
    return m_backend->list_sessions_by_artist(artist_id);
}

bool StorageManager::archive_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("archive_session");
    cache_erase(session_id);
    bool moved = m_backend->archive_session(session_id);
    if (moved) LogPrintStorage(DEBUG, "Session archived: %s", session_id.c_str());
    return moved;
}

size_t StorageManager::archive_old_sessions(int days, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("archive_old_sessions");

    const int64_t threshold = now_ms - static_cast<int64_t>(days) * MS_PER_DAY;
    size_t archived = 0;
    for (const DNASession& session : m_backend->list_sessions()) {
        if (session.started_at < threshold) {
            cache_erase(session.session_id);
            if (m_backend->archive_session(session.session_id)) archived++;
        }
    }

    LogPrintStorage(INFO, "Archived %zu sessions older than %d days", archived, days);
    return archived;
}

std::optional<DNASession> StorageManager::load_archived_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("load_archived_session");
    return m_backend->load_archived_session(session_id);
}

std::vector<DNASession> StorageManager::list_archived_sessions() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("list_archived_sessions");
    return m_backend->list_archived_sessions();
}

void StorageManager::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("clear");
    m_backend->clear();
    m_cache.clear();
    m_lru.clear();
    LogPrintStorage(INFO, "Storage cleared");
}

StorageStats StorageManager::get_stats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    require_initialized("get_stats");

    StorageStats stats;
    std::vector<DNASession> sessions = m_backend->list_sessions();
    stats.total_sessions = sessions.size();
    for (const DNASession& session : sessions) {
        stats.total_strokes += session.total_strokes;
    }
    stats.storage_size_bytes = m_backend->stored_bytes();
    return stats;
}

std::string StorageManager::backend_name() const {
    return m_backend->name();
}

size_t StorageManager::cached_sessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

} // namespace art_dna
