// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/storage_backend.h>

#include <art_dna/dna_serialization.h>
#include <util/logging.h>

#include <algorithm>

namespace art_dna {

std::vector<DNASession> IStorageBackend::list_sessions_by_artist(const std::string& artist_id) {
    std::vector<DNASession> result;
    for (DNASession& session : list_sessions()) {
        if (session.artist_id && *session.artist_id == artist_id) {
            result.push_back(std::move(session));
        }
    }
    return result;
}

std::optional<DNASession> DecodeSessionRecord(const std::vector<uint8_t>& record, const std::string& key) {
    std::optional<DNASession> session = DeserializeSession(record);
    if (!session) {
        LogPrintStorage(WARN, "Skipping corrupt session record %s (%zu bytes)", key.c_str(), record.size());
    }
    return session;
}

void SortByStartTime(std::vector<DNASession>& sessions) {
    std::stable_sort(sessions.begin(), sessions.end(), [](const DNASession& a, const DNASession& b) {
        if (a.started_at != b.started_at) return a.started_at < b.started_at;
        return a.session_id < b.session_id;
    });
}

} // namespace art_dna
