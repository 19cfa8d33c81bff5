// ============= test/test_pipeline.cpp =============
#include "concurrency/thread_pool.hpp"
#include "pipeline/attendance_pipeline.hpp"
#include "pipeline/identity_registry.hpp"
#include "provider/timed_embedding_provider.hpp"
#include "test_support.hpp"

using namespace rollcall;
using namespace std::chrono_literals;
using test::check;

static const std::vector<float> ALICE = {1, 0, 0, 0};
static const std::vector<float> BOB = {0, 1, 0, 0};
static const std::vector<float> STRANGER = {0.3f, 0, 0.9539392f, 0};

struct Fixture {
    test::MemoryStore store;
    EmbeddingGallery gallery{4};
    Deduplicator dedup{store, std::chrono::seconds(300)};
    test::ScriptedProvider provider{4};
    FrameProcessor processor;
    AttendancePipeline pipeline{gallery, processor, dedup, provider, 0.6f};
    IdentityRegistry registry{gallery, store, dedup, provider};

    Fixture() {
        provider.script("alice.jpg", {ALICE});
        provider.script("bob.jpg", {BOB});
        provider.script("stranger.jpg", {STRANGER});
        provider.script("pair.jpg", {ALICE, STRANGER});
        provider.script("crowd.jpg", {BOB, ALICE});
    }
};

void test_registry() {
    test::section("identity registry");
    Fixture f;

    auto alice = f.registry.register_identity("U1", "Alice", "alice.jpg");
    check(alice.embedding == ALICE, "registration uses provider embedding");
    check(f.gallery.size() == 1 && f.store.list_identities().size() == 1, "gallery and store updated");

    bool no_face = false;
    try { f.registry.register_identity("U2", "Nobody", "empty.jpg"); } catch (const NoFaceDetected&) { no_face = true; }
    check(no_face, "image without face -> NoFaceDetected");

    bool decode = false;
    try { f.registry.register_identity("U2", "Broken", "bad"); } catch (const DecodeError&) { decode = true; }
    check(decode, "undecodable image -> DecodeError");

    bool invalid = false;
    try { f.registry.register_identity("", "Anon", "bob.jpg"); } catch (const InvalidIdentity&) { invalid = true; }
    check(invalid, "empty id -> InvalidIdentity");
    check(f.gallery.size() == 1 && f.store.list_identities().size() == 1, "rejected registrations change nothing");

    f.registry.register_identity("U1", "Alice Again", "bob.jpg");
    auto snap = f.gallery.snapshot();
    check(snap->size() == 1 && snap->find("U1")->embedding == BOB, "re-registration replaces");

    check(f.registry.remove_identity("U1"), "remove existing identity");
    check(!f.registry.remove_identity("U1"), "remove absent identity -> false");
    check(f.gallery.size() == 0, "gallery empty after removal");
}

// upsert lento: deja una ventana entre la escritura y la publicación
class SlowIdentityStore : public test::MemoryStore {
public:
    void upsert_identity(const Identity& identity) override {
        std::this_thread::sleep_for(100ms);
        test::MemoryStore::upsert_identity(identity);
    }
};

void test_concurrent_register_and_remove() {
    test::section("register / remove race");
    SlowIdentityStore store;
    EmbeddingGallery gallery(4);
    Deduplicator dedup(store, std::chrono::seconds(300));
    test::ScriptedProvider provider(4);
    IdentityRegistry registry(gallery, store, dedup, provider);

    std::thread writer([&] { registry.register_embedding("U1", "Alice", ALICE); });
    std::this_thread::sleep_for(30ms);
    bool removed = registry.remove_identity("U1");
    writer.join();

    check(removed, "remove waits for the in-flight registration");
    check(store.list_identities().empty(), "store empty");
    check(gallery.size() == 0, "gallery empty");
    check((store.list_identities().size() == 1) == (gallery.size() == 1), "store and gallery agree");
}

void test_recognition_scenario() {
    test::section("recognition scenario");
    Fixture f;
    f.registry.register_embedding("U1", "Alice", ALICE);

    TimePoint t0 = Clock::now();
    auto r1 = f.pipeline.recognize({ALICE}, EventType::Entry, t0);
    auto* single = std::get_if<SingleResponse>(&r1);
    check(single && single->face.outcome == FaceOutcome::Accepted, "E at 0.6 -> accepted entry");
    check(single && test::near(single->face.match.similarity, 1.0), "similarity 1.0");

    auto r2 = f.pipeline.recognize({ALICE}, EventType::Entry, t0 + 20s);
    single = std::get_if<SingleResponse>(&r2);
    check(single && single->face.outcome == FaceOutcome::AlreadyMarked, "E again -> already_marked");
    check(single && single->face.timestamp && *single->face.timestamp == t0, "already_marked carries first timestamp");

    auto r3 = f.pipeline.recognize({STRANGER}, EventType::Entry, t0 + 30s);
    single = std::get_if<SingleResponse>(&r3);
    check(single && single->face.outcome == FaceOutcome::Unmatched &&
          single->face.match.reason == MatchReason::BelowThreshold, "0.3 similarity -> below_threshold");
    check(f.store.event_count() == 1, "no event created for unmatched face");

    auto r4 = f.pipeline.recognize({ALICE, STRANGER}, EventType::Entry, t0 + 40s);
    auto* multiple = std::get_if<MultipleResponse>(&r4);
    check(multiple && multiple->faces.size() == 2, "two faces -> multiple response");
    check(multiple && multiple->faces[0].outcome == FaceOutcome::AlreadyMarked, "first face already marked");
    check(multiple && multiple->faces[1].outcome == FaceOutcome::Unmatched, "second face unmatched");

    auto r5 = f.pipeline.recognize({}, EventType::Entry, t0);
    check(std::holds_alternative<NoFaceResponse>(r5), "zero faces -> no-face response");
}

void test_capture_and_listener() {
    test::section("capture + listener");
    Fixture f;
    f.registry.register_embedding("U1", "Alice", ALICE);
    f.registry.register_embedding("U2", "Bob", BOB);

    std::vector<std::pair<AttendanceEvent, std::string>> notices;
    f.pipeline.set_event_listener([&](const AttendanceEvent& e, const std::string& name,
                                      const std::optional<Punctuality>&) {
        notices.emplace_back(e, name);
    });

    auto r = f.pipeline.capture("crowd.jpg", EventType::Exit);
    auto* multiple = std::get_if<MultipleResponse>(&r);
    check(multiple && multiple->faces.size() == 2, "capture of two registered faces");
    check(multiple && multiple->faces[0].match.identity_id == std::string("U2") &&
          multiple->faces[1].match.identity_id == std::string("U1"), "faces in provider order");
    check(notices.size() == 2, "listener notified per accepted event");
    check(!notices.empty() && notices[0].second == "Bob" && notices[0].first.event_type == EventType::Exit,
          "notice carries name and type");

    auto bad = f.pipeline.capture("bad", EventType::Entry);
    auto* error = std::get_if<ErrorResponse>(&bad);
    check(error && error->kind == ErrorKind::Decode, "bad image -> decode error response");

    auto none = f.pipeline.capture("empty.jpg", EventType::Entry);
    check(std::holds_alternative<NoFaceResponse>(none), "no face -> no-face response");

    f.store.fail_appends = true;
    auto failed = f.pipeline.capture("alice.jpg", EventType::Entry);
    auto* single = std::get_if<SingleResponse>(&failed);
    check(single && single->face.outcome == FaceOutcome::PersistFailed, "failed append -> persist failed outcome");
    check(notices.size() == 2, "no notice for failed append");
}

void test_diagnose() {
    test::section("diagnose");
    Fixture f;
    f.registry.register_embedding("U1", "Alice", ALICE);
    f.registry.register_embedding("U2", "Bob", BOB);

    auto result = f.pipeline.diagnose("pair.jpg", 0.6f);
    check(result.match_found, "first face matches Alice");
    check(result.best_match && result.best_match->identity_id == "U1", "best match reported");
    check(result.all_similarities.size() == 2, "every identity ranked");
    check(result.all_similarities[0].match && !result.all_similarities[1].match, "rows flagged");

    bool no_face = false;
    try { f.pipeline.diagnose("empty.jpg", 0.6f); } catch (const NoFaceDetected&) { no_face = true; }
    check(no_face, "diagnose without face -> NoFaceDetected");

    check(f.store.event_count() == 0, "diagnose never creates events");
}

void test_delete_event_reopens_key() {
    test::section("delete event");
    Fixture f;
    f.registry.register_embedding("U1", "Alice", ALICE);

    auto r = f.pipeline.capture("alice.jpg", EventType::Entry);
    auto* single = std::get_if<SingleResponse>(&r);
    check(single && single->face.event_id > 0, "event recorded");

    check(f.registry.delete_event(single ? single->face.event_id : -1), "delete existing event");
    check(!f.registry.delete_event(424242), "delete unknown event -> false");

    auto again = f.pipeline.capture("alice.jpg", EventType::Entry);
    single = std::get_if<SingleResponse>(&again);
    check(single && single->face.outcome == FaceOutcome::Accepted, "key reopened after deletion");
}

void test_provider_timeout() {
    test::section("provider timeout");
    auto inner = std::make_shared<test::ScriptedProvider>(4);
    inner->slow_delay = 300ms;
    inner->script("alice.jpg", {ALICE});

    ThreadPool pool(2, "provider-test");
    TimedEmbeddingProvider timed(inner, pool, 50ms);

    bool timed_out = false;
    try { timed.extract("slow"); } catch (const ProviderTimeout&) { timed_out = true; }
    check(timed_out, "slow provider -> ProviderTimeout");

    auto faces = timed.extract("alice.jpg");
    check(faces.size() == 1, "fast provider passes through");

    bool decode = false;
    try { timed.extract("bad"); } catch (const DecodeError&) { decode = true; }
    check(decode, "provider exceptions propagate through the decorator");

    pool.wait_all();
}

void test_timeout_backlog() {
    test::section("abandoned provider calls");
    auto inner = std::make_shared<test::ScriptedProvider>(4);
    inner->slow_delay = 350ms;
    inner->script("alice.jpg", {ALICE});

    ThreadPool pool(1, "provider-backlog");
    TimedEmbeddingProvider timed(inner, pool, 100ms);

    int timeouts = 0;
    for (int i = 0; i < 5; ++i) {
        try { timed.extract("slow"); } catch (const ProviderTimeout&) { timeouts++; }
    }
    check(timeouts == 5, "five slow calls time out");

    // Solo queda la llamada en curso; las abandonadas no se ejecutan
    std::this_thread::sleep_for(400ms);
    auto faces = timed.extract("alice.jpg");
    check(faces.size() == 1, "fast call served once the running call ends");

    pool.wait_all();
    check(inner->calls < 6, "abandoned calls skipped");
    spdlog::info("  provider ran {} of 6 calls", inner->calls.load());
}

void test_queue_cap() {
    test::section("provider queue cap");
    auto inner = std::make_shared<test::ScriptedProvider>(4);
    inner->slow_delay = 300ms;

    ThreadPool pool(1, "provider-cap");
    TimedEmbeddingProvider timed(inner, pool, 50ms, 2);

    int rejected = 0;
    for (int i = 0; i < 5; ++i) {
        try { timed.extract("slow"); } catch (const ProviderTimeout&) { rejected++; }
        check(pool.pending_tasks() <= 2, "queued provider work bounded");
    }
    check(rejected == 5, "every call answered with ProviderTimeout");

    pool.wait_all();
    check(inner->calls == 1, "only the running call reached the provider");
}

// Objeto que registra si alguna tarea lo usa ya destruido
struct Watched {
    std::atomic<bool>& alive;
    int uses = 0;
    explicit Watched(std::atomic<bool>& alive) : alive(alive) { alive = true; }
    ~Watched() { alive = false; }
};

void test_pool_shutdown_order() {
    test::section("pool shutdown");
    ThreadPool pool(1, "shutdown-test");
    std::atomic<bool> alive{false};
    std::atomic<bool> used_after_destroy{false};
    std::atomic<int> ran{0};

    {
        Watched target(alive);
        PoolShutdown shutdown{{&pool}};
        for (int i = 0; i < 3; ++i) {
            pool.post([&] {
                std::this_thread::sleep_for(50ms);
                if (!alive) {
                    used_after_destroy = true;
                    return;
                }
                target.uses++;
                ran++;
            });
        }
    }

    check(!used_after_destroy, "queued tasks finish before referenced objects die");
    check(ran == 3, "pending tasks drained on shutdown");

    bool rejected = false;
    try { pool.post([] {}); } catch (const std::runtime_error&) { rejected = true; }
    check(rejected, "pool refuses work after shutdown");
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("🧪 Attendance Pipeline / Registry");

    test_registry();
    test_concurrent_register_and_remove();
    test_recognition_scenario();
    test_capture_and_listener();
    test_diagnose();
    test_delete_event_reopens_key();
    test_provider_timeout();
    test_timeout_backlog();
    test_queue_cap();
    test_pool_shutdown_order();

    return test::finish("test_pipeline");
}
