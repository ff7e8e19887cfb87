// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/storage_leveldb.h>

#include <art_dna/dna_errors.h>
#include <art_dna/dna_serialization.h>
#include <db/db_errors.h>
#include <util/error_format.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <leveldb/iterator.h>
#include <leveldb/write_batch.h>

#include <algorithm>
#include <set>

namespace art_dna {

const std::string LevelDBStorageBackend::SESSION_PREFIX = "session:";
const std::string LevelDBStorageBackend::TIME_INDEX_PREFIX = "idx_time:";
const std::string LevelDBStorageBackend::ARTIST_INDEX_PREFIX = "idx_artist:";
const std::string LevelDBStorageBackend::ARCHIVE_PREFIX = "archive:";

namespace {

std::vector<uint8_t> ToBytes(const std::string& value) {
    return std::vector<uint8_t>(value.begin(), value.end());
}

} // namespace

LevelDBStorageBackend::LevelDBStorageBackend(std::string path)
    : m_path(std::move(path)) {}

LevelDBStorageBackend::~LevelDBStorageBackend() {
    Close();
}

void LevelDBStorageBackend::initialize() {
    if (m_db) return;  // Already open

    leveldb::Options options;
    options.create_if_missing = true;

    leveldb::DB* raw_db = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, m_path, &raw_db);
    if (!status.ok()) {
        DBErrorType error_type = ClassifyDBError(status);
        std::string message = GetDBErrorMessage(status, error_type);
        LogPrintStorage(ERROR, "%s", CErrorFormatter::FormatForLog(
            CErrorFormatter::StorageError("open " + m_path, message)).c_str());
        throw BackendUnavailable("Failed to open session database: " + message);
    }

    m_db.reset(raw_db);
    LogPrintStorage(INFO, "Session database opened at %s", m_path.c_str());
}

void LevelDBStorageBackend::Close() {
    m_db.reset();
}

std::string LevelDBStorageBackend::make_time_key(int64_t started_at, const std::string& session_id) {
    // Zero padding keeps lexicographic order equal to numeric order
    unsigned long long t = started_at < 0 ? 0ULL : static_cast<unsigned long long>(started_at);
    return TIME_INDEX_PREFIX + strprintf("%020llu", t) + ":" + session_id;
}

std::string LevelDBStorageBackend::make_artist_key(const std::string& artist_id, const std::string& session_id) {
    return ARTIST_INDEX_PREFIX + artist_id + ":" + session_id;
}

leveldb::DB& LevelDBStorageBackend::db(const std::string& operation) const {
    if (!m_db) {
        throw BackendUnavailable("Session database not open (" + operation + ")");
    }
    return *m_db;
}

void LevelDBStorageBackend::check(const leveldb::Status& status, const std::string& operation) const {
    if (status.ok()) return;
    DBErrorType error_type = ClassifyDBError(status);
    std::string message = GetDBErrorMessage(status, error_type);
    LogPrintStorage(ERROR, "%s", CErrorFormatter::FormatForLog(
        CErrorFormatter::StorageError(operation, message)).c_str());
    throw BackendUnavailable(operation + " failed: " + message);
}

std::optional<std::string> LevelDBStorageBackend::get_raw(const std::string& key, const std::string& operation) const {
    std::string value;
    leveldb::Status status = db(operation).Get(leveldb::ReadOptions(), key, &value);
    if (status.IsNotFound()) return std::nullopt;
    check(status, operation);
    return value;
}

void LevelDBStorageBackend::write(leveldb::WriteBatch& batch, const std::string& operation) {
    check(db(operation).Write(leveldb::WriteOptions(), &batch), operation);
}

void LevelDBStorageBackend::unindex(leveldb::WriteBatch& batch, const std::string& session_id,
                                    const std::string& record) const {
    std::optional<DNASession> old = DecodeSessionRecord(ToBytes(record), SESSION_PREFIX + session_id);
    if (!old) return;  // Stale index entries are skipped when listing
    batch.Delete(make_time_key(old->started_at, session_id));
    if (old->artist_id) batch.Delete(make_artist_key(*old->artist_id, session_id));
}

std::vector<std::pair<std::string, std::string>> LevelDBStorageBackend::scan(const std::string& prefix,
                                                                             const std::string& operation) const {
    std::vector<std::pair<std::string, std::string>> entries;
    std::unique_ptr<leveldb::Iterator> it(db(operation).NewIterator(leveldb::ReadOptions()));
    for (it->Seek(prefix); it->Valid(); it->Next()) {
        std::string key = it->key().ToString();
        if (key.compare(0, prefix.size(), prefix) != 0) break;
        entries.emplace_back(std::move(key), it->value().ToString());
    }
    check(it->status(), operation);
    return entries;
}

std::vector<DNASession> LevelDBStorageBackend::resolve_index(const std::string& prefix,
                                                             const std::string& operation) const {
    std::vector<DNASession> result;
    std::set<std::string> seen;
    for (const auto& [key, session_id] : scan(prefix, operation)) {
        if (!seen.insert(session_id).second) continue;
        std::optional<std::string> record = get_raw(SESSION_PREFIX + session_id, operation);
        if (!record) continue;  // Index entry outlived its record
        std::optional<DNASession> session = DecodeSessionRecord(ToBytes(*record), SESSION_PREFIX + session_id);
        if (session) result.push_back(std::move(*session));
    }
    return result;
}

void LevelDBStorageBackend::save_session(const DNASession& session) {
    const std::string key = SESSION_PREFIX + session.session_id;
    std::vector<uint8_t> record = SerializeSession(session);

    leveldb::WriteBatch batch;
    std::optional<std::string> existing = get_raw(key, "save_session");
    if (existing) unindex(batch, session.session_id, *existing);

    batch.Put(key, leveldb::Slice(reinterpret_cast<const char*>(record.data()), record.size()));
    batch.Put(make_time_key(session.started_at, session.session_id), session.session_id);
    if (session.artist_id) {
        batch.Put(make_artist_key(*session.artist_id, session.session_id), session.session_id);
    }
    write(batch, "save_session");
}

std::optional<DNASession> LevelDBStorageBackend::load_session(const std::string& session_id) {
    std::optional<std::string> record = get_raw(SESSION_PREFIX + session_id, "load_session");
    if (!record) return std::nullopt;
    return DecodeSessionRecord(ToBytes(*record), SESSION_PREFIX + session_id);
}

bool LevelDBStorageBackend::delete_session(const std::string& session_id) {
    const std::string key = SESSION_PREFIX + session_id;
    std::optional<std::string> existing = get_raw(key, "delete_session");
    if (!existing) return false;

    leveldb::WriteBatch batch;
    unindex(batch, session_id, *existing);
    batch.Delete(key);
    write(batch, "delete_session");
    return true;
}

std::vector<DNASession> LevelDBStorageBackend::list_sessions() {
    return resolve_index(TIME_INDEX_PREFIX, "list_sessions");
}

std::vector<DNASession> LevelDBStorageBackend::list_sessions_by_artist(const std::string& artist_id) {
    std::vector<DNASession> result = resolve_index(ARTIST_INDEX_PREFIX + artist_id + ":", "list_sessions_by_artist");
    // The prefix also matches artists whose id extends this one past a ':'
    result.erase(std::remove_if(result.begin(), result.end(),
                                [&artist_id](const DNASession& s) { return s.artist_id != artist_id; }),
                 result.end());
    SortByStartTime(result);
    return result;
}

bool LevelDBStorageBackend::archive_session(const std::string& session_id) {
    const std::string key = SESSION_PREFIX + session_id;
    std::optional<std::string> existing = get_raw(key, "archive_session");
    if (!existing) return false;

    leveldb::WriteBatch batch;
    unindex(batch, session_id, *existing);
    batch.Delete(key);
    batch.Put(ARCHIVE_PREFIX + session_id, *existing);
    write(batch, "archive_session");
    return true;
}

std::optional<DNASession> LevelDBStorageBackend::load_archived_session(const std::string& session_id) {
    std::optional<std::string> record = get_raw(ARCHIVE_PREFIX + session_id, "load_archived_session");
    if (!record) return std::nullopt;
    return DecodeSessionRecord(ToBytes(*record), ARCHIVE_PREFIX + session_id);
}

std::vector<DNASession> LevelDBStorageBackend::list_archived_sessions() {
    std::vector<DNASession> result;
    for (const auto& [key, record] : scan(ARCHIVE_PREFIX, "list_archived_sessions")) {
        std::optional<DNASession> session = DecodeSessionRecord(ToBytes(record), key);
        if (session) result.push_back(std::move(*session));
    }
    SortByStartTime(result);
    return result;
}

void LevelDBStorageBackend::clear() {
    leveldb::WriteBatch batch;
    size_t removed = 0;
    for (const std::string& prefix : {SESSION_PREFIX, TIME_INDEX_PREFIX, ARTIST_INDEX_PREFIX, ARCHIVE_PREFIX}) {
        for (const auto& entry : scan(prefix, "clear")) {
            batch.Delete(entry.first);
            removed++;
        }
    }
    write(batch, "clear");
    LogPrintStorage(DEBUG, "Cleared %zu keys from %s", removed, m_path.c_str());
}

uint64_t LevelDBStorageBackend::stored_bytes() {
    uint64_t total = 0;
    for (const auto& entry : scan(SESSION_PREFIX, "stored_bytes")) {
        total += entry.second.size();
    }
    return total;
}

} // namespace art_dna
