// ============= include/gallery/embedding_gallery.hpp =============
/*
 * Embedding Gallery - Copy-on-write
 *
 * CARACTERÍSTICAS:
 * - Un embedding por identidad (upsert reemplaza por identity_id)
 * - snapshot() es O(1): devuelve shared_ptr a una vista inmutable
 * - Lectores nunca bloquean; escritores se serializan entre sí
 *   y publican una nueva vista con atomic_store
 * - Un match en curso nunca ve un upsert/remove concurrente
 */

#pragma once
#include "core/types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rollcall {

struct GalleryEntry {
    std::string identity_id;
    std::string display_name;
    std::vector<float> embedding;
    float norm;                 // ||embedding||, precalculado
    TimePoint registered_at;
};

class GallerySnapshot {
public:
    GallerySnapshot(int dimension, std::vector<GalleryEntry> entries);

    const std::vector<GalleryEntry>& entries() const { return items; }
    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }
    int dimension() const { return dim; }

    // nullptr si no existe
    const GalleryEntry* find(const std::string& identity_id) const;

private:
    int dim;
    std::vector<GalleryEntry> items;
    std::unordered_map<std::string, size_t> by_id;
};

using GallerySnapshotPtr = std::shared_ptr<const GallerySnapshot>;

class EmbeddingGallery {
public:
    explicit EmbeddingGallery(int dimension);

    // Throws InvalidIdentity / InvalidEmbedding; la galería queda intacta
    void upsert(const Identity& identity);

    // Idempotente
    void remove(const std::string& identity_id);

    // Reemplaza todo el contenido en una sola publicación (arranque)
    void load(const std::vector<Identity>& identities);

    GallerySnapshotPtr snapshot() const;

    // Misma validación que upsert(), sin modificar nada
    void validate(const Identity& identity) const;

    size_t size() const { return snapshot()->size(); }
    int dimension() const { return dim; }

private:
    int dim;
    std::mutex write_mutex;
    GallerySnapshotPtr current;

    GalleryEntry make_entry(const Identity& identity) const;
    void publish(GallerySnapshotPtr next);
};

}  // namespace rollcall
