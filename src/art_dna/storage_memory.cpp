// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/storage_memory.h>

#include <art_dna/dna_serialization.h>

namespace art_dna {

void MemoryStorageBackend::initialize() {}

void MemoryStorageBackend::save_session(const DNASession& session) {
    m_sessions[session.session_id] = SerializeSession(session);
}

std::optional<DNASession> MemoryStorageBackend::load_session(const std::string& session_id) {
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) return std::nullopt;
    return DecodeSessionRecord(it->second, session_id);
}

bool MemoryStorageBackend::delete_session(const std::string& session_id) {
    return m_sessions.erase(session_id) > 0;
}

std::vector<DNASession> MemoryStorageBackend::decode_all(const RecordMap& records, const std::string& ns) {
    std::vector<DNASession> result;
    result.reserve(records.size());
    for (const auto& [id, record] : records) {
        std::optional<DNASession> session = DecodeSessionRecord(record, ns + id);
        if (session) result.push_back(std::move(*session));
    }
    SortByStartTime(result);
    return result;
}

std::vector<DNASession> MemoryStorageBackend::list_sessions() {
    return decode_all(m_sessions, "session:");
}

bool MemoryStorageBackend::archive_session(const std::string& session_id) {
    auto it = m_sessions.find(session_id);
    if (it == m_sessions.end()) return false;
    m_archives[session_id] = std::move(it->second);
    m_sessions.erase(it);
    return true;
}

std::optional<DNASession> MemoryStorageBackend::load_archived_session(const std::string& session_id) {
    auto it = m_archives.find(session_id);
    if (it == m_archives.end()) return std::nullopt;
    return DecodeSessionRecord(it->second, "archive:" + session_id);
}

std::vector<DNASession> MemoryStorageBackend::list_archived_sessions() {
    return decode_all(m_archives, "archive:");
}

void MemoryStorageBackend::clear() {
    m_sessions.clear();
    m_archives.clear();
}

uint64_t MemoryStorageBackend::stored_bytes() {
    uint64_t total = 0;
    for (const auto& [id, record] : m_sessions) total += record.size();
    return total;
}

void MemoryStorageBackend::put_raw(const std::string& session_id, std::vector<uint8_t> record) {
    m_sessions[session_id] = std::move(record);
}

} // namespace art_dna
