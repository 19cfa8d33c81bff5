// ============= src/pipeline/identity_registry.cpp =============
#include "pipeline/identity_registry.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

IdentityRegistry::IdentityRegistry(EmbeddingGallery& gallery,
                                   AttendanceStore& store,
                                   Deduplicator& deduplicator,
                                   EmbeddingProvider& provider)
    : gallery(gallery), store(store), deduplicator(deduplicator), provider(provider)
{
}

Identity IdentityRegistry::register_identity(const std::string& identity_id,
                                             const std::string& display_name,
                                             const std::string& image_bytes) {
    auto faces = provider.extract(image_bytes);
    if (faces.empty()) {
        throw NoFaceDetected();
    }
    if (faces.size() > 1) {
        spdlog::warn("Register '{}': {} faces detected, using the first one", identity_id, faces.size());
    }

    return register_embedding(identity_id, display_name, faces.front().embedding);
}

Identity IdentityRegistry::register_embedding(const std::string& identity_id,
                                              const std::string& display_name,
                                              const std::vector<float>& embedding) {
    Identity identity;
    identity.identity_id = identity_id;
    identity.display_name = display_name;
    identity.embedding = embedding;
    identity.registered_at = Clock::now();

    gallery.validate(identity);
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        store.upsert_identity(identity);
        gallery.upsert(identity);
    }

    spdlog::info("✓ Registered {} ({}) - gallery size {}", identity_id, display_name, gallery.size());
    return identity;
}

bool IdentityRegistry::remove_identity(const std::string& identity_id) {
    bool existed;
    {
        std::lock_guard<std::mutex> lock(write_mutex);
        existed = store.delete_identity(identity_id);
        gallery.remove(identity_id);
    }

    if (existed) {
        spdlog::info("✓ Identity removed: {}", identity_id);
    }
    return existed;
}

std::vector<Identity> IdentityRegistry::list_identities() {
    return store.list_identities();
}

std::vector<AttendanceEvent> IdentityRegistry::list_events() {
    return store.list_events();
}

bool IdentityRegistry::delete_event(int64_t event_id) {
    auto event = store.find_event(event_id);
    if (!event) return false;

    if (!store.delete_event(event_id)) return false;

    deduplicator.forget_event(*event);
    spdlog::info("✓ Attendance event {} deleted ({} {})",
                 event_id, event->identity_id, to_string(event->event_type));
    return true;
}

void IdentityRegistry::restore() {
    std::lock_guard<std::mutex> lock(write_mutex);
    gallery.load(store.list_identities());
    deduplicator.warm_up();
}

}  // namespace rollcall
