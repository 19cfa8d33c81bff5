// ============= src/gallery/embedding_gallery.cpp =============
#include "gallery/embedding_gallery.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cmath>

namespace rollcall {

// ==================== SNAPSHOT ====================

GallerySnapshot::GallerySnapshot(int dimension, std::vector<GalleryEntry> entries)
    : dim(dimension), items(std::move(entries))
{
    by_id.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        by_id[items[i].identity_id] = i;
    }
}

const GalleryEntry* GallerySnapshot::find(const std::string& identity_id) const {
    auto it = by_id.find(identity_id);
    return it == by_id.end() ? nullptr : &items[it->second];
}

// ==================== GALLERY ====================

EmbeddingGallery::EmbeddingGallery(int dimension)
    : dim(dimension),
      current(std::make_shared<const GallerySnapshot>(dimension, std::vector<GalleryEntry>{}))
{
    if (dimension <= 0) {
        throw std::invalid_argument("Gallery dimension must be positive");
    }
}

void EmbeddingGallery::validate(const Identity& identity) const {
    if (identity.identity_id.empty()) {
        throw InvalidIdentity("identity_id must not be empty");
    }
    if (identity.display_name.empty()) {
        throw InvalidIdentity("display_name must not be empty");
    }
    if (identity.embedding.size() != static_cast<size_t>(dim)) {
        throw InvalidEmbedding("Invalid embedding size: " + std::to_string(identity.embedding.size()) +
                               " (expected " + std::to_string(dim) + ")");
    }

    double norm_sq = 0.0;
    for (float v : identity.embedding) {
        if (!std::isfinite(v)) {
            throw InvalidEmbedding("Embedding contains non-finite values");
        }
        norm_sq += static_cast<double>(v) * v;
    }
    if (norm_sq <= 0.0) {
        throw InvalidEmbedding("Embedding has zero norm");
    }
}

GalleryEntry EmbeddingGallery::make_entry(const Identity& identity) const {
    validate(identity);

    double norm_sq = 0.0;
    for (float v : identity.embedding) norm_sq += static_cast<double>(v) * v;

    GalleryEntry entry;
    entry.identity_id = identity.identity_id;
    entry.display_name = identity.display_name;
    entry.embedding = identity.embedding;
    entry.norm = static_cast<float>(std::sqrt(norm_sq));
    entry.registered_at = identity.registered_at;
    return entry;
}

GallerySnapshotPtr EmbeddingGallery::snapshot() const {
    return std::atomic_load(&current);
}

void EmbeddingGallery::publish(GallerySnapshotPtr next) {
    std::atomic_store(&current, std::move(next));
}

void EmbeddingGallery::upsert(const Identity& identity) {
    // Validar antes de tomar el lock: un error nunca toca la galería
    GalleryEntry entry = make_entry(identity);

    std::lock_guard<std::mutex> lock(write_mutex);
    auto base = snapshot();

    std::vector<GalleryEntry> entries = base->entries();
    bool replaced = false;
    for (auto& existing : entries) {
        if (existing.identity_id == entry.identity_id) {
            existing = entry;
            replaced = true;
            break;
        }
    }
    if (!replaced) entries.push_back(std::move(entry));

    publish(std::make_shared<const GallerySnapshot>(dim, std::move(entries)));

    spdlog::debug("Gallery {} '{}' ({} identities)",
                  replaced ? "replaced" : "added", identity.identity_id, base->size() + (replaced ? 0 : 1));
}

void EmbeddingGallery::remove(const std::string& identity_id) {
    std::lock_guard<std::mutex> lock(write_mutex);
    auto base = snapshot();
    if (!base->find(identity_id)) return;

    std::vector<GalleryEntry> entries;
    entries.reserve(base->size() - 1);
    for (const auto& existing : base->entries()) {
        if (existing.identity_id != identity_id) entries.push_back(existing);
    }

    publish(std::make_shared<const GallerySnapshot>(dim, std::move(entries)));
    spdlog::debug("Gallery removed '{}'", identity_id);
}

void EmbeddingGallery::load(const std::vector<Identity>& identities) {
    std::vector<GalleryEntry> entries;
    entries.reserve(identities.size());

    std::unordered_map<std::string, size_t> seen;
    for (const auto& identity : identities) {
        GalleryEntry entry;
        try {
            entry = make_entry(identity);
        } catch (const Error& e) {
            spdlog::warn("Gallery: identidad '{}' ignorada al cargar: {}", identity.identity_id, e.what());
            continue;
        }

        auto it = seen.find(entry.identity_id);
        if (it != seen.end()) {
            entries[it->second] = std::move(entry);
        } else {
            seen[entry.identity_id] = entries.size();
            entries.push_back(std::move(entry));
        }
    }

    std::lock_guard<std::mutex> lock(write_mutex);
    publish(std::make_shared<const GallerySnapshot>(dim, std::move(entries)));
    spdlog::info("✓ Gallery loaded: {} identities (dim={})", seen.size(), dim);
}

}  // namespace rollcall
