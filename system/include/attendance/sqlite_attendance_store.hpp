// ============= include/attendance/sqlite_attendance_store.hpp =============
/*
 * SQLite Attendance Store
 *
 * TABLAS:
 *   identities(identity_id PK, display_name, embedding BLOB, registered_at_ms)
 *   attendance_events(event_id PK AUTOINCREMENT, identity_id, event_type,
 *                     occurred_at_ms, confidence)
 *
 * - WAL + synchronous=NORMAL
 * - Embeddings como BLOB de floats
 * - Una conexión compartida protegida por db_mutex
 * - ":memory:" soportado (tests)
 */

#pragma once
#include "attendance/attendance_store.hpp"
#include <mutex>
#include <sqlite3.h>

namespace rollcall {

class SqliteAttendanceStore : public AttendanceStore {
public:
    explicit SqliteAttendanceStore(const std::string& db_path);
    ~SqliteAttendanceStore() override;

    SqliteAttendanceStore(const SqliteAttendanceStore&) = delete;
    SqliteAttendanceStore& operator=(const SqliteAttendanceStore&) = delete;

    int64_t append_event(const AttendanceEvent& event) override;
    std::vector<AttendanceEvent> list_events() override;
    std::optional<AttendanceEvent> find_event(int64_t event_id) override;
    bool delete_event(int64_t event_id) override;
    std::optional<TimePoint> latest_event_time(const std::string& identity_id,
                                               EventType event_type) override;

    void upsert_identity(const Identity& identity) override;
    bool delete_identity(const std::string& identity_id) override;
    std::vector<Identity> list_identities() override;

    size_t count_events();
    const std::string& path() const { return db_path; }

private:
    sqlite3* db;
    std::string db_path;
    mutable std::mutex db_mutex;

    void init_database();
    void create_tables();
    sqlite3_stmt* prepare(const char* sql);
    [[noreturn]] void fail(const std::string& what);

    static AttendanceEvent read_event(sqlite3_stmt* stmt);
    static std::vector<unsigned char> serialize_embedding(const std::vector<float>& emb);
    static std::vector<float> deserialize_embedding(const void* data, int size);
};

}  // namespace rollcall
