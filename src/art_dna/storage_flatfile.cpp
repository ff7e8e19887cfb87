// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <art_dna/storage_flatfile.h>

#include <art_dna/dna_errors.h>
#include <art_dna/dna_serialization.h>
#include <util/error_format.h>
#include <util/logging.h>

#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>

namespace art_dna {

constexpr uint8_t FlatFileStorageBackend::FILE_MAGIC[4];
const std::string FlatFileStorageBackend::SESSION_PREFIX = "session_";
const std::string FlatFileStorageBackend::ARCHIVE_PREFIX = "archive_";

namespace {

[[noreturn]] void RaiseStorage(const std::string& operation, const std::string& details) {
    LogPrintStorage(ERROR, "%s", CErrorFormatter::FormatForLog(CErrorFormatter::StorageError(operation, details)).c_str());
    throw BackendUnavailable(operation + ": " + details);
}

template <typename T>
bool ReadLE(std::ifstream& file, T& value) {
    uint8_t buf[sizeof(T)];
    if (!file.read(reinterpret_cast<char*>(buf), sizeof(T))) return false;
    value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value |= static_cast<T>(static_cast<T>(buf[i]) << (8 * i));
    }
    return true;
}

template <typename T>
void WriteLE(std::ofstream& file, T value) {
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); i++) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    file.write(reinterpret_cast<const char*>(buf), sizeof(T));
}

} // namespace

FlatFileStorageBackend::FlatFileStorageBackend(std::string path)
    : m_path(std::move(path)) {}

void FlatFileStorageBackend::initialize() {
    if (m_path.empty()) {
        RaiseStorage("initialize", "no storage path configured");
    }
    load_file();
    LogPrintStorage(INFO, "Loaded %zu keys from %s", m_entries.size(), m_path.c_str());
}

void FlatFileStorageBackend::load_file() {
    m_entries.clear();

    std::ifstream file(m_path, std::ios::binary);
    if (!file) {
        // No file yet: a fresh store
        return;
    }

    file.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    uint8_t magic[4];
    if (!file.read(reinterpret_cast<char*>(magic), sizeof(magic)) ||
        std::memcmp(magic, FILE_MAGIC, sizeof(magic)) != 0) {
        RaiseStorage("load", "invalid magic in " + m_path);
    }

    uint8_t version = 0;
    if (!ReadLE(file, version) || version != FILE_VERSION) {
        RaiseStorage("load", "unsupported version " + std::to_string(version) + " in " + m_path);
    }

    uint32_t count = 0;
    if (!ReadLE(file, count)) {
        RaiseStorage("load", "truncated header in " + m_path);
    }

    KeyMap entries;
    for (uint32_t i = 0; i < count; i++) {
        uint16_t key_len = 0;
        if (!ReadLE(file, key_len)) RaiseStorage("load", "truncated key length in " + m_path);
        std::string key(key_len, '\0');
        if (key_len > 0 && !file.read(&key[0], key_len)) RaiseStorage("load", "truncated key in " + m_path);

        uint32_t value_len = 0;
        if (!ReadLE(file, value_len)) RaiseStorage("load", "truncated value length for " + key);
        if (value_len > file_size - static_cast<uint64_t>(file.tellg())) {
            RaiseStorage("load", "value length " + std::to_string(value_len) + " for " + key +
                         " exceeds the rest of " + m_path);
        }
        std::vector<uint8_t> value(value_len);
        if (value_len > 0 && !file.read(reinterpret_cast<char*>(value.data()), value_len)) {
            RaiseStorage("load", "truncated value for " + key);
        }
        entries[key] = std::move(value);
    }

    m_entries.swap(entries);
}

void FlatFileStorageBackend::write_file(const KeyMap& entries) const {
    const std::string temp_path = m_path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            RaiseStorage("write", "cannot open " + temp_path);
        }

        file.write(reinterpret_cast<const char*>(FILE_MAGIC), sizeof(FILE_MAGIC));
        WriteLE<uint8_t>(file, FILE_VERSION);
        WriteLE<uint32_t>(file, static_cast<uint32_t>(entries.size()));

        for (const auto& [key, value] : entries) {
            WriteLE<uint16_t>(file, static_cast<uint16_t>(key.size()));
            file.write(key.data(), static_cast<std::streamsize>(key.size()));
            WriteLE<uint32_t>(file, static_cast<uint32_t>(value.size()));
            if (!value.empty()) {
                file.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
            }
        }

        file.flush();
        if (!file) {
            file.close();
            (void)std::remove(temp_path.c_str());
            RaiseStorage("write", "short write to " + temp_path);
        }
    }

    if (std::rename(temp_path.c_str(), m_path.c_str()) != 0) {
        (void)std::remove(temp_path.c_str());
        RaiseStorage("write", "failed to rename " + temp_path + " to " + m_path);
    }
}

void FlatFileStorageBackend::commit(KeyMap next) {
    write_file(next);
    m_entries.swap(next);
}

std::optional<DNASession> FlatFileStorageBackend::get(const std::string& key) const {
    auto it = m_entries.find(key);
    if (it == m_entries.end()) return std::nullopt;
    return DecodeSessionRecord(it->second, key);
}

std::vector<DNASession> FlatFileStorageBackend::list_prefix(const std::string& prefix) const {
    std::vector<DNASession> result;
    for (auto it = m_entries.lower_bound(prefix); it != m_entries.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        std::optional<DNASession> session = DecodeSessionRecord(it->second, it->first);
        if (session) result.push_back(std::move(*session));
    }
    SortByStartTime(result);
    return result;
}

void FlatFileStorageBackend::save_session(const DNASession& session) {
    std::string key = SESSION_PREFIX + session.session_id;
    if (key.size() > std::numeric_limits<uint16_t>::max()) {
        throw InvalidInput(CErrorFormatter::InputError("session id", "too long for flat-file storage"));
    }
    KeyMap next = m_entries;
    next[key] = SerializeSession(session);
    commit(std::move(next));
}

std::optional<DNASession> FlatFileStorageBackend::load_session(const std::string& session_id) {
    return get(SESSION_PREFIX + session_id);
}

bool FlatFileStorageBackend::delete_session(const std::string& session_id) {
    std::string key = SESSION_PREFIX + session_id;
    if (m_entries.find(key) == m_entries.end()) return false;
    KeyMap next = m_entries;
    next.erase(key);
    commit(std::move(next));
    return true;
}

std::vector<DNASession> FlatFileStorageBackend::list_sessions() {
    return list_prefix(SESSION_PREFIX);
}

bool FlatFileStorageBackend::archive_session(const std::string& session_id) {
    auto it = m_entries.find(SESSION_PREFIX + session_id);
    if (it == m_entries.end()) return false;
    KeyMap next = m_entries;
    next[ARCHIVE_PREFIX + session_id] = it->second;
    next.erase(SESSION_PREFIX + session_id);
    commit(std::move(next));
    return true;
}

std::optional<DNASession> FlatFileStorageBackend::load_archived_session(const std::string& session_id) {
    return get(ARCHIVE_PREFIX + session_id);
}

std::vector<DNASession> FlatFileStorageBackend::list_archived_sessions() {
    return list_prefix(ARCHIVE_PREFIX);
}

void FlatFileStorageBackend::clear() {
    commit(KeyMap());
}

uint64_t FlatFileStorageBackend::stored_bytes() {
    uint64_t total = 0;
    for (auto it = m_entries.lower_bound(SESSION_PREFIX); it != m_entries.end(); ++it) {
        if (it->first.compare(0, SESSION_PREFIX.size(), SESSION_PREFIX) != 0) break;
        total += it->second.size();
    }
    return total;
}

} // namespace art_dna
