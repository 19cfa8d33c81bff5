// ============= src/attendance/sqlite_attendance_store.cpp =============
#include "attendance/sqlite_attendance_store.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <cstring>
#include <filesystem>
#include <memory>

namespace rollcall {

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr wrap(sqlite3_stmt* stmt) {
    return StmtPtr(stmt, &sqlite3_finalize);
}

}  // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

SqliteAttendanceStore::SqliteAttendanceStore(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("🗄️  Inicializando Attendance Store");
    spdlog::info("   Path: {}", db_path);

    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    init_database();

    spdlog::info("✓ Attendance store ready ({} events)", count_events());
}

SqliteAttendanceStore::~SqliteAttendanceStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

void SqliteAttendanceStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw PersistenceError("Cannot open database '" + db_path + "': " + msg);
    }

    char* err = nullptr;
    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &err);
    if (err) {
        spdlog::warn("PRAGMA journal_mode: {}", err);
        sqlite3_free(err);
        err = nullptr;
    }
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, &err);
    if (err) {
        spdlog::warn("PRAGMA synchronous: {}", err);
        sqlite3_free(err);
    }
    sqlite3_busy_timeout(db, 5000);

    create_tables();
}

void SqliteAttendanceStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS identities (
            identity_id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL,
            embedding BLOB NOT NULL,
            registered_at_ms INTEGER NOT NULL
        );
        CREATE TABLE IF NOT EXISTS attendance_events (
            event_id INTEGER PRIMARY KEY AUTOINCREMENT,
            identity_id TEXT NOT NULL,
            event_type TEXT NOT NULL,
            occurred_at_ms INTEGER NOT NULL,
            confidence REAL NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_events_key
            ON attendance_events(identity_id, event_type, occurred_at_ms);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        throw PersistenceError("Failed to create tables: " + msg);
    }
}

sqlite3_stmt* SqliteAttendanceStore::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare statement");
    }
    return stmt;
}

void SqliteAttendanceStore::fail(const std::string& what) {
    std::string msg = what + ": " + sqlite3_errmsg(db);
    spdlog::error("SQLite: {}", msg);
    throw PersistenceError(msg);
}

// ==================== SERIALIZATION ====================

std::vector<unsigned char> SqliteAttendanceStore::serialize_embedding(const std::vector<float>& emb) {
    std::vector<unsigned char> blob(emb.size() * sizeof(float));
    std::memcpy(blob.data(), emb.data(), blob.size());
    return blob;
}

std::vector<float> SqliteAttendanceStore::deserialize_embedding(const void* data, int size) {
    std::vector<float> emb(size / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), data, emb.size() * sizeof(float));
    }
    return emb;
}

AttendanceEvent SqliteAttendanceStore::read_event(sqlite3_stmt* stmt) {
    AttendanceEvent event;
    event.event_id = sqlite3_column_int64(stmt, 0);
    event.identity_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    event.event_type = parse_event_type(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
    event.occurred_at = from_epoch_ms(sqlite3_column_int64(stmt, 3));
    event.confidence = static_cast<float>(sqlite3_column_double(stmt, 4));
    return event;
}

// ==================== EVENTS ====================

int64_t SqliteAttendanceStore::append_event(const AttendanceEvent& event) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare(
        "INSERT INTO attendance_events (identity_id, event_type, occurred_at_ms, confidence) "
        "VALUES (?, ?, ?, ?)"));

    sqlite3_bind_text(stmt.get(), 1, event.identity_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, to_string(event.event_type), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 3, to_epoch_ms(event.occurred_at));
    sqlite3_bind_double(stmt.get(), 4, event.confidence);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("Failed to insert event");
    }

    int64_t event_id = sqlite3_last_insert_rowid(db);
    spdlog::debug("✓ Event {} stored: {} {}", event_id, event.identity_id, to_string(event.event_type));
    return event_id;
}

std::vector<AttendanceEvent> SqliteAttendanceStore::list_events() {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare(
        "SELECT event_id, identity_id, event_type, occurred_at_ms, confidence "
        "FROM attendance_events ORDER BY occurred_at_ms ASC, event_id ASC"));

    std::vector<AttendanceEvent> events;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        events.push_back(read_event(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        fail("Failed to list events");
    }
    return events;
}

std::optional<AttendanceEvent> SqliteAttendanceStore::find_event(int64_t event_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare(
        "SELECT event_id, identity_id, event_type, occurred_at_ms, confidence "
        "FROM attendance_events WHERE event_id = ?"));
    sqlite3_bind_int64(stmt.get(), 1, event_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_event(stmt.get());
    if (rc != SQLITE_DONE) fail("Failed to find event");
    return std::nullopt;
}

bool SqliteAttendanceStore::delete_event(int64_t event_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare("DELETE FROM attendance_events WHERE event_id = ?"));
    sqlite3_bind_int64(stmt.get(), 1, event_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("Failed to delete event");
    }
    return sqlite3_changes(db) > 0;
}

std::optional<TimePoint> SqliteAttendanceStore::latest_event_time(const std::string& identity_id,
                                                                  EventType event_type) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare(
        "SELECT MAX(occurred_at_ms) FROM attendance_events "
        "WHERE identity_id = ? AND event_type = ?"));
    sqlite3_bind_text(stmt.get(), 1, identity_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, to_string(event_type), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) fail("Failed to query latest event");

    if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) return std::nullopt;
    return from_epoch_ms(sqlite3_column_int64(stmt.get(), 0));
}

size_t SqliteAttendanceStore::count_events() {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare("SELECT COUNT(*) FROM attendance_events"));
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) fail("Failed to count events");
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

// ==================== IDENTITIES ====================

void SqliteAttendanceStore::upsert_identity(const Identity& identity) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto blob = serialize_embedding(identity.embedding);
    auto stmt = wrap(prepare(
        "INSERT INTO identities (identity_id, display_name, embedding, registered_at_ms) "
        "VALUES (?, ?, ?, ?) "
        "ON CONFLICT(identity_id) DO UPDATE SET "
        "display_name = excluded.display_name, "
        "embedding = excluded.embedding, "
        "registered_at_ms = excluded.registered_at_ms"));

    sqlite3_bind_text(stmt.get(), 1, identity.identity_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, identity.display_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt.get(), 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 4, to_epoch_ms(identity.registered_at));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("Failed to upsert identity");
    }
    spdlog::info("✓ Identity stored: {} ({})", identity.identity_id, identity.display_name);
}

bool SqliteAttendanceStore::delete_identity(const std::string& identity_id) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare("DELETE FROM identities WHERE identity_id = ?"));
    sqlite3_bind_text(stmt.get(), 1, identity_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        fail("Failed to delete identity");
    }
    return sqlite3_changes(db) > 0;
}

std::vector<Identity> SqliteAttendanceStore::list_identities() {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = wrap(prepare(
        "SELECT identity_id, display_name, embedding, registered_at_ms "
        "FROM identities ORDER BY registered_at_ms ASC, identity_id ASC"));

    std::vector<Identity> identities;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Identity identity;
        identity.identity_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 0));
        identity.display_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 1));
        identity.embedding = deserialize_embedding(sqlite3_column_blob(stmt.get(), 2),
                                                   sqlite3_column_bytes(stmt.get(), 2));
        identity.registered_at = from_epoch_ms(sqlite3_column_int64(stmt.get(), 3));
        identities.push_back(std::move(identity));
    }
    if (rc != SQLITE_DONE) {
        fail("Failed to list identities");
    }
    return identities;
}

}  // namespace rollcall
