// ============= test/test_sqlite_store.cpp =============
#include "attendance/sqlite_attendance_store.hpp"
#include "attendance/deduplicator.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace rollcall;
using namespace std::chrono_literals;
using test::check;

static AttendanceEvent make_event(const std::string& id, EventType type, TimePoint at, float conf) {
    AttendanceEvent e;
    e.identity_id = id;
    e.event_type = type;
    e.occurred_at = at;
    e.confidence = conf;
    return e;
}

void test_identities(SqliteAttendanceStore& store) {
    test::section("identities");

    Identity alice;
    alice.identity_id = "U1";
    alice.display_name = "Alice";
    alice.embedding = {0.25f, -0.5f, 0.75f, 1.0f};
    alice.registered_at = from_epoch_ms(1700000000123);
    store.upsert_identity(alice);

    Identity bob = alice;
    bob.identity_id = "U2";
    bob.display_name = "Bob";
    bob.registered_at = from_epoch_ms(1700000001000);
    store.upsert_identity(bob);

    auto all = store.list_identities();
    check(all.size() == 2, "two identities listed");
    check(all[0].identity_id == "U1" && all[0].embedding == alice.embedding, "embedding blob round-trips");
    check(all[0].registered_at == alice.registered_at, "registered_at round-trips (ms)");

    alice.display_name = "Alice B.";
    alice.embedding = {1.0f, 0.0f, 0.0f, 0.0f};
    store.upsert_identity(alice);
    all = store.list_identities();
    check(all.size() == 2, "upsert replaces instead of duplicating");
    check(all[0].display_name == "Alice B." && all[0].embedding[0] == 1.0f, "replacement stored");

    check(store.delete_identity("U2"), "delete existing identity -> true");
    check(!store.delete_identity("U2"), "delete absent identity -> false");
    check(store.list_identities().size() == 1, "one identity left");
}

void test_events(SqliteAttendanceStore& store) {
    test::section("events");
    TimePoint base = from_epoch_ms(1700000100000);

    int64_t e1 = store.append_event(make_event("U1", EventType::Entry, base, 0.91f));
    int64_t e2 = store.append_event(make_event("U1", EventType::Exit, base + 30min, 0.88f));
    int64_t e3 = store.append_event(make_event("U1", EventType::Entry, base + 2h, 0.93f));
    check(e1 < e2 && e2 < e3, "event ids are monotonic");

    auto events = store.list_events();
    check(events.size() == 3, "three events listed");
    check(events[1].event_type == EventType::Exit && events[1].occurred_at == base + 30min,
          "type and timestamp round-trip");
    check(test::near(events[2].confidence, 0.93, 1e-6), "confidence round-trips");

    auto found = store.find_event(e2);
    check(found && found->event_id == e2 && found->identity_id == "U1", "find_event by id");
    check(!store.find_event(9999).has_value(), "find_event missing -> nullopt");

    auto latest = store.latest_event_time("U1", EventType::Entry);
    check(latest && *latest == base + 2h, "latest_event_time per key");
    check(!store.latest_event_time("U9", EventType::Entry).has_value(), "latest_event_time unknown key -> nullopt");

    check(store.delete_event(e3), "delete existing event -> true");
    check(!store.delete_event(e3), "delete absent event -> false");
    latest = store.latest_event_time("U1", EventType::Entry);
    check(latest && *latest == base, "latest falls back after deletion");

    // Borrar la identidad no toca sus eventos
    store.delete_identity("U1");
    check(store.list_events().size() == 2, "identity deletion does not cascade");
}

void test_restart_warm_up() {
    test::section("restart");
    auto path = std::filesystem::temp_directory_path() / "rollcall_test_store.db";
    std::filesystem::remove(path);

    TimePoint now = Clock::now();
    {
        SqliteAttendanceStore store(path.string());
        Deduplicator dedup(store, std::chrono::seconds(300));
        auto d = dedup.decide("U1", EventType::Entry, 0.9f, now);
        check(d.accept, "first run accepts entry");
    }
    {
        SqliteAttendanceStore store(path.string());
        Deduplicator dedup(store, std::chrono::seconds(300));
        dedup.warm_up();
        auto d = dedup.decide("U1", EventType::Entry, 0.9f, now + 5s);
        check(!d.accept && d.reason == DecisionReason::AlreadyMarked, "second run honours persisted event");
        check(store.count_events() == 1, "still one event on disk");
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("🧪 SQLite Attendance Store");

    try {
        SqliteAttendanceStore store(":memory:");
        test_identities(store);
        test_events(store);
        test_restart_warm_up();
    } catch (const std::exception& e) {
        spdlog::error("Unexpected exception: {}", e.what());
        return 1;
    }

    return test::finish("test_sqlite_store");
}
