// ============= test/test_gallery.cpp =============
#include "gallery/embedding_gallery.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"
#include <atomic>
#include <thread>

using namespace rollcall;
using test::check;

static Identity make_identity(const std::string& id, const std::string& name, std::vector<float> emb) {
    Identity identity;
    identity.identity_id = id;
    identity.display_name = name;
    identity.embedding = std::move(emb);
    identity.registered_at = Clock::now();
    return identity;
}

template<typename E, typename F>
bool throws(F&& f) {
    try {
        f();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_upsert_and_replace() {
    test::section("upsert / replace");
    EmbeddingGallery gallery(4);

    gallery.upsert(make_identity("U1", "Alice", {1, 0, 0, 0}));
    gallery.upsert(make_identity("U2", "Bob", {0, 1, 0, 0}));
    check(gallery.size() == 2, "two identities inserted");

    gallery.upsert(make_identity("U1", "Alice B.", {0, 0, 1, 0}));
    auto snap = gallery.snapshot();
    check(snap->size() == 2, "re-registration replaces by key");

    const GalleryEntry* alice = snap->find("U1");
    check(alice && alice->display_name == "Alice B.", "replacement carries new name");
    check(alice && alice->embedding[2] == 1.0f, "replacement carries new embedding");
    check(alice && test::near(alice->norm, 1.0), "norm precomputed");
}

void test_validation() {
    test::section("validation");
    EmbeddingGallery gallery(4);
    gallery.upsert(make_identity("U1", "Alice", {1, 0, 0, 0}));

    check(throws<InvalidEmbedding>([&] { gallery.upsert(make_identity("U2", "Bob", {1, 0, 0})); }),
          "wrong dimension -> InvalidEmbedding");
    check(throws<InvalidEmbedding>([&] { gallery.upsert(make_identity("U2", "Bob", {0, 0, 0, 0})); }),
          "zero vector -> InvalidEmbedding");
    check(throws<InvalidIdentity>([&] { gallery.upsert(make_identity("", "Bob", {0, 1, 0, 0})); }),
          "empty id -> InvalidIdentity");
    check(throws<InvalidIdentity>([&] { gallery.upsert(make_identity("U2", "", {0, 1, 0, 0})); }),
          "empty name -> InvalidIdentity");

    // Un upsert rechazado no toca nada, ni siquiera un reemplazo
    check(throws<InvalidEmbedding>([&] { gallery.upsert(make_identity("U1", "Alice", {1, 0})); }),
          "invalid replacement rejected");
    auto snap = gallery.snapshot();
    check(snap->size() == 1 && snap->find("U1")->embedding.size() == 4, "gallery unchanged after rejections");
}

void test_remove_idempotent() {
    test::section("remove");
    EmbeddingGallery gallery(4);
    gallery.upsert(make_identity("U1", "Alice", {1, 0, 0, 0}));

    gallery.remove("U1");
    check(gallery.size() == 0, "identity removed");
    gallery.remove("U1");
    gallery.remove("nobody");
    check(gallery.size() == 0, "remove of absent id is a no-op");
}

void test_snapshot_isolation() {
    test::section("snapshot isolation");
    EmbeddingGallery gallery(4);
    gallery.upsert(make_identity("U1", "Alice", {1, 0, 0, 0}));

    auto before = gallery.snapshot();
    gallery.upsert(make_identity("U2", "Bob", {0, 1, 0, 0}));
    gallery.remove("U1");

    check(before->size() == 1 && before->find("U1") != nullptr, "old snapshot unaffected by later mutations");
    auto after = gallery.snapshot();
    check(after->size() == 1 && after->find("U2") != nullptr, "next snapshot sees mutations");
}

void test_load() {
    test::section("load");
    EmbeddingGallery gallery(4);
    gallery.upsert(make_identity("OLD", "Old", {1, 1, 0, 0}));

    gallery.load({
        make_identity("U1", "Alice", {1, 0, 0, 0}),
        make_identity("U2", "Bob", {0, 1, 0, 0}),
        make_identity("BAD", "Broken", {1, 0}),
        make_identity("U1", "Alice 2", {0, 0, 0, 1}),
    });

    auto snap = gallery.snapshot();
    check(snap->size() == 2, "load replaces content and skips invalid rows");
    check(snap->find("OLD") == nullptr, "previous content dropped");
    check(snap->find("U1") && snap->find("U1")->display_name == "Alice 2", "later duplicate wins");
}

void test_concurrent_readers() {
    test::section("concurrent readers / writer");
    EmbeddingGallery gallery(4);
    gallery.upsert(make_identity("U0", "Base", {1, 0, 0, 0}));

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop) {
                auto snap = gallery.snapshot();
                for (const auto& entry : snap->entries()) {
                    if (entry.embedding.size() != 4 || snap->find(entry.identity_id) != &entry) torn++;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i) {
        gallery.upsert(make_identity("U" + std::to_string(i % 20), "N", {1, float(i), 0, 0}));
        if (i % 7 == 0) gallery.remove("U" + std::to_string(i % 20));
    }

    stop = true;
    for (auto& t : readers) t.join();

    check(torn == 0, "readers never observe a partially-built snapshot");
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("🧪 Embedding Gallery");

    test_upsert_and_replace();
    test_validation();
    test_remove_idempotent();
    test_snapshot_isolation();
    test_load();
    test_concurrent_readers();

    return test::finish("test_gallery");
}
