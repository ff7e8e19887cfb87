// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Unit tests for session storage
 *
 * Every backend runs the same save/load/archive/list checks through
 * StorageManager. Backend-specific tests cover flat-file persistence,
 * corrupt records and the manager's session cache.
 */

// Part of main Boost test suite (no BOOST_TEST_MODULE here)
#include <boost/test/unit_test.hpp>

#include <art_dna/dna_errors.h>
#include <art_dna/dna_serialization.h>
#include <art_dna/storage_flatfile.h>
#include <art_dna/storage_leveldb.h>
#include <art_dna/storage_manager.h>
#include <art_dna/storage_memory.h>

#include <openssl/sha.h>

#include <filesystem>
#include <fstream>

using namespace art_dna;

namespace fs = std::filesystem;

namespace {

const int64_t NOW = 1700000000000LL;
const int64_t DAY = 86400000LL;

/** Scratch directory removed on scope exit */
struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& name) {
        path = fs::temp_directory_path() / ("artdna_" + name + "_" + GenerateDNAId("t"));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

DNASession MakeSession(const std::string& id, int64_t started_at, size_t strokes,
                       const std::optional<std::string>& artist = std::nullopt) {
    DNASession session;
    session.session_id = id;
    session.artist_id = artist;
    session.name = "canvas " + id;
    session.started_at = started_at;
    for (size_t i = 0; i < strokes; i++) {
        StrokeDNA dna;
        dna.dna_id = "stroke_" + id + "_" + std::to_string(i);
        dna.stroke_id = "s" + std::to_string(i);
        dna.session_id = id;
        dna.tool = "brush";
        dna.color = "#336699";
        for (size_t d = 0; d < STROKE_DIMENSIONS; d++) dna.features[d] = 0.1f * d + i;
        session.add_stroke(dna);
    }
    return session;
}

std::vector<std::string> Ids(const std::vector<DNASession>& sessions) {
    std::vector<std::string> ids;
    for (const DNASession& s : sessions) ids.push_back(s.session_id);
    return ids;
}

DNAConfig ConfigFor(StorageMode mode, const std::string& path) {
    DNAConfig config;
    config.storage_mode = mode;
    config.storage_path = path;
    return config;
}

/** Behaviour every backend must share */
void CheckBackendContract(StorageManager& storage) {
    BOOST_CHECK_THROW(storage.load_session("a"), BackendUnavailable);
    storage.initialize();
    storage.initialize();
    BOOST_CHECK(storage.is_initialized());
    storage.clear();

    storage.save_session(MakeSession("late", NOW, 3, std::string("ana")));
    storage.save_session(MakeSession("early", NOW - 40 * DAY, 2, std::string("ben")));
    storage.save_session(MakeSession("mid", NOW - 10 * DAY, 1, std::string("ana")));

    std::optional<DNASession> loaded = storage.load_session("late");
    BOOST_REQUIRE(loaded);
    BOOST_CHECK_EQUAL(loaded->total_strokes, 3u);
    BOOST_REQUIRE_EQUAL(loaded->stroke_dna.size(), 3u);
    BOOST_CHECK_EQUAL(loaded->stroke_dna[2].features[4], 0.1f * 4 + 2);
    BOOST_REQUIRE(loaded->artist_id);
    BOOST_CHECK_EQUAL(*loaded->artist_id, "ana");
    BOOST_CHECK(!storage.load_session("missing"));

    // Listing is ordered by start time
    std::vector<std::string> expected{"early", "mid", "late"};
    BOOST_CHECK(Ids(storage.list_sessions()) == expected);

    std::vector<std::string> ana{"mid", "late"};
    BOOST_CHECK(Ids(storage.list_sessions_by_artist("ana")) == ana);
    BOOST_CHECK(storage.list_sessions_by_artist("nobody").empty());

    StorageStats stats = storage.get_stats();
    BOOST_CHECK_EQUAL(stats.total_sessions, 3u);
    BOOST_CHECK_EQUAL(stats.total_strokes, 6u);
    BOOST_CHECK(stats.storage_size_bytes > 0u);

    // An artist id that extends another one is a different artist
    storage.save_session(MakeSession("nested", NOW - 5 * DAY, 1, std::string("ana:x")));
    BOOST_CHECK(Ids(storage.list_sessions_by_artist("ana")) == ana);
    std::vector<std::string> nested{"nested"};
    BOOST_CHECK(Ids(storage.list_sessions_by_artist("ana:x")) == nested);
    BOOST_CHECK(storage.delete_session("nested"));

    // Overwrite replaces the record and its index entries
    storage.save_session(MakeSession("mid", NOW - 10 * DAY, 4, std::string("ben")));
    BOOST_CHECK_EQUAL(storage.load_session("mid")->total_strokes, 4u);
    std::vector<std::string> ana_after{"late"};
    BOOST_CHECK(Ids(storage.list_sessions_by_artist("ana")) == ana_after);

    // Archive moves a session out of the live set
    BOOST_CHECK(storage.archive_session("late"));
    BOOST_CHECK(!storage.archive_session("late"));
    BOOST_CHECK(!storage.load_session("late"));
    std::optional<DNASession> archived = storage.load_archived_session("late");
    BOOST_REQUIRE(archived);
    BOOST_CHECK_EQUAL(archived->total_strokes, 3u);

    BOOST_CHECK_EQUAL(storage.archive_old_sessions(30, NOW), 1u);
    std::vector<std::string> live{"mid"};
    BOOST_CHECK(Ids(storage.list_sessions()) == live);
    std::vector<std::string> archive{"early", "late"};
    BOOST_CHECK(Ids(storage.list_archived_sessions()) == archive);

    BOOST_CHECK(storage.delete_session("mid"));
    BOOST_CHECK(!storage.delete_session("mid"));
    BOOST_CHECK(storage.list_sessions().empty());

    storage.clear();
    BOOST_CHECK(storage.list_archived_sessions().empty());
    BOOST_CHECK_EQUAL(storage.get_stats().total_sessions, 0u);
}

} // namespace

BOOST_AUTO_TEST_SUITE(storage_tests)

BOOST_AUTO_TEST_CASE(memory_backend_contract) {
    StorageManager storage(ConfigFor(StorageMode::MEMORY, ""));
    BOOST_CHECK_EQUAL(storage.backend_name(), "memory");
    CheckBackendContract(storage);
}

BOOST_AUTO_TEST_CASE(flatfile_backend_contract) {
    TempDir dir("flatfile");
    StorageManager storage(ConfigFor(StorageMode::FLATFILE, (dir.path / "sessions.dat").string()));
    BOOST_CHECK_EQUAL(storage.backend_name(), "flatfile");
    CheckBackendContract(storage);
}

BOOST_AUTO_TEST_CASE(leveldb_backend_contract) {
    TempDir dir("leveldb");
    StorageManager storage(ConfigFor(StorageMode::LEVELDB, (dir.path / "sessions").string()));
    BOOST_CHECK_EQUAL(storage.backend_name(), "leveldb");
    CheckBackendContract(storage);
}

BOOST_AUTO_TEST_CASE(flatfile_persists_across_reopen) {
    TempDir dir("reopen");
    const std::string path = (dir.path / "sessions.dat").string();
    {
        StorageManager storage(ConfigFor(StorageMode::FLATFILE, path));
        storage.initialize();
        storage.save_session(MakeSession("kept", NOW, 2));
        storage.save_session(MakeSession("old", NOW - DAY, 1));
        BOOST_CHECK(storage.archive_session("old"));
    }
    StorageManager reopened(ConfigFor(StorageMode::FLATFILE, path));
    reopened.initialize();
    std::optional<DNASession> kept = reopened.load_session("kept");
    BOOST_REQUIRE(kept);
    BOOST_CHECK_EQUAL(kept->stroke_dna.size(), 2u);
    BOOST_CHECK(reopened.load_archived_session("old"));
    BOOST_CHECK_EQUAL(reopened.list_sessions().size(), 1u);
}

BOOST_AUTO_TEST_CASE(leveldb_persists_across_reopen) {
    TempDir dir("ldb_reopen");
    const std::string path = (dir.path / "sessions").string();
    {
        StorageManager storage(ConfigFor(StorageMode::LEVELDB, path));
        storage.initialize();
        storage.save_session(MakeSession("kept", NOW, 2, std::string("cai")));
    }
    StorageManager reopened(ConfigFor(StorageMode::LEVELDB, path));
    reopened.initialize();
    BOOST_CHECK(reopened.load_session("kept"));
    BOOST_CHECK_EQUAL(reopened.list_sessions_by_artist("cai").size(), 1u);
}

BOOST_AUTO_TEST_CASE(flatfile_rejects_foreign_file) {
    TempDir dir("foreign");
    const fs::path path = dir.path / "sessions.dat";
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not a session store";
    }
    FlatFileStorageBackend backend(path.string());
    BOOST_CHECK_THROW(backend.initialize(), BackendUnavailable);

    FlatFileStorageBackend unnamed("");
    BOOST_CHECK_THROW(unnamed.initialize(), BackendUnavailable);
}

BOOST_AUTO_TEST_CASE(flatfile_rejects_oversized_value_length) {
    TempDir dir("oversized");
    const fs::path path = dir.path / "sessions.dat";
    {
        // Header and one key whose value length runs far past the end of the file
        const uint8_t bytes[] = {
            'A', 'D', 'N', 'F', 0x01,
            0x01, 0x00, 0x00, 0x00,
            0x03, 0x00, 'k', 'e', 'y',
            0xF0, 0xFF, 0xFF, 0xFF,
            0x01, 0x02, 0x03, 0x04,
        };
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes), sizeof(bytes));
    }
    FlatFileStorageBackend backend(path.string());
    BOOST_CHECK_THROW(backend.initialize(), BackendUnavailable);

    StorageManager storage(ConfigFor(StorageMode::FLATFILE, path.string()));
    BOOST_CHECK_THROW(storage.initialize(), BackendUnavailable);
}

BOOST_AUTO_TEST_CASE(missing_flatfile_is_empty_store) {
    TempDir dir("missing");
    FlatFileStorageBackend backend((dir.path / "none.dat").string());
    backend.initialize();
    BOOST_CHECK(backend.list_sessions().empty());
    BOOST_CHECK_EQUAL(backend.stored_bytes(), 0u);
}

BOOST_AUTO_TEST_CASE(corrupt_records_are_rejected) {
    MemoryStorageBackend* backend = new MemoryStorageBackend();
    StorageManager storage(DNAConfig(), std::unique_ptr<IStorageBackend>(backend));
    storage.initialize();

    std::vector<uint8_t> record = SerializeSession(MakeSession("flipped", NOW, 2));
    record[record.size() / 2] ^= 0x40;
    backend->put_raw("flipped", record);
    backend->put_raw("garbage", {0x01, 0x02, 0x03});
    storage.save_session(MakeSession("good", NOW, 1));

    BOOST_CHECK(!storage.load_session("flipped"));
    BOOST_CHECK(!storage.load_session("garbage"));

    std::vector<std::string> ids{"good"};
    BOOST_CHECK(Ids(storage.list_sessions()) == ids);
}

BOOST_AUTO_TEST_CASE(cache_is_bounded) {
    DNAConfig config;
    config.max_sessions_in_memory = 2;
    StorageManager storage(config, std::unique_ptr<IStorageBackend>(new MemoryStorageBackend()));
    storage.initialize();

    storage.save_session(MakeSession("a", NOW, 1));
    storage.save_session(MakeSession("b", NOW, 1));
    storage.save_session(MakeSession("c", NOW, 1));
    BOOST_CHECK_EQUAL(storage.cached_sessions(), 2u);

    // Evicted sessions still load from the backend
    std::optional<DNASession> a = storage.load_session("a");
    BOOST_REQUIRE(a);
    BOOST_CHECK_EQUAL(a->session_id, "a");
    BOOST_CHECK_EQUAL(storage.cached_sessions(), 2u);

    storage.delete_session("a");
    BOOST_CHECK_EQUAL(storage.cached_sessions(), 1u);
    BOOST_CHECK(!storage.load_session("a"));

    DNAConfig uncached;
    uncached.max_sessions_in_memory = 0;
    StorageManager none(uncached, std::unique_ptr<IStorageBackend>(new MemoryStorageBackend()));
    none.initialize();
    none.save_session(MakeSession("x", NOW, 1));
    BOOST_CHECK_EQUAL(none.cached_sessions(), 0u);
    BOOST_CHECK(none.load_session("x"));
}

BOOST_AUTO_TEST_CASE(session_record_envelope) {
    DNASession session = MakeSession("env", NOW, 1, std::string("dee"));
    session.ended_at = NOW + 1000;
    std::vector<uint8_t> bytes = SerializeSession(session);
    BOOST_REQUIRE(bytes.size() > 4);
    BOOST_CHECK_EQUAL(std::string(bytes.begin(), bytes.begin() + 4), "ADN1");

    std::optional<DNASession> decoded = DeserializeSession(bytes);
    BOOST_REQUIRE(decoded);
    BOOST_REQUIRE(decoded->ended_at);
    BOOST_CHECK_EQUAL(*decoded->ended_at, NOW + 1000);
    BOOST_CHECK_EQUAL(*decoded->name, "canvas env");

    bytes.pop_back();
    BOOST_CHECK(!DeserializeSession(bytes));
}

BOOST_AUTO_TEST_CASE(session_with_inflated_stroke_count_is_rejected) {
    DNASession session;
    session.session_id = "big";
    session.started_at = NOW;
    std::vector<uint8_t> bytes = SerializeSession(session);

    // Envelope header (magic, version, type, payload length) then the payload:
    // id string, two absent optionals, started_at, absent ended_at, stroke count
    const size_t payload_start = 4 + 1 + 1 + 4;
    const size_t count_at = payload_start + (4 + 3) + 1 + 1 + 8 + 1;
    const size_t body_len = bytes.size() - SHA256_DIGEST_LENGTH;
    BOOST_REQUIRE(count_at + 4 <= body_len);
    BOOST_CHECK_EQUAL(bytes[count_at], 0);

    // One stroke per remaining byte passes a plain byte count but no stroke fits in one byte
    const uint32_t count = static_cast<uint32_t>(body_len - count_at - 4);
    for (int i = 0; i < 4; i++) bytes[count_at + i] = static_cast<uint8_t>(count >> (8 * i));
    SHA256(bytes.data(), body_len, bytes.data() + body_len);
    BOOST_CHECK(!DeserializeSession(bytes));
}

BOOST_AUTO_TEST_SUITE_END()
