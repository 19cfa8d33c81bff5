// ============= include/pipeline/identity_registry.hpp =============
#pragma once
#include "attendance/attendance_store.hpp"
#include "attendance/deduplicator.hpp"
#include "gallery/embedding_gallery.hpp"
#include "provider/embedding_provider.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace rollcall {

/*
 * Registro de identidades y administración de eventos.
 * Único camino que muta la galería.
 *
 * Orden en register: provider -> validar -> store -> gallery.
 * Si el store falla la galería no cambia.
 *
 * Register y delete toman write_mutex durante store + gallery: el store y
 * la galería nunca quedan en desacuerdo. El provider corre fuera del lock.
 */
class IdentityRegistry {
public:
    IdentityRegistry(EmbeddingGallery& gallery,
                     AttendanceStore& store,
                     Deduplicator& deduplicator,
                     EmbeddingProvider& provider);

    // Usa la primera cara. DecodeError / NoFaceDetected / InvalidIdentity /
    // InvalidEmbedding / PersistenceError. Re-registrar reemplaza.
    Identity register_identity(const std::string& identity_id,
                               const std::string& display_name,
                               const std::string& image_bytes);

    // Igual que register_identity con un embedding ya calculado
    Identity register_embedding(const std::string& identity_id,
                                const std::string& display_name,
                                const std::vector<float>& embedding);

    // false si no existía. Los eventos históricos se conservan
    bool remove_identity(const std::string& identity_id);

    std::vector<Identity> list_identities();
    std::vector<AttendanceEvent> list_events();

    // false si no existía
    bool delete_event(int64_t event_id);

    // Carga identidades persistidas en la galería y calienta el dedup
    void restore();

private:
    EmbeddingGallery& gallery;
    AttendanceStore& store;
    Deduplicator& deduplicator;
    EmbeddingProvider& provider;

    std::mutex write_mutex;
};

}  // namespace rollcall
