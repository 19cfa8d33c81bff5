// ============= include/provider/timed_embedding_provider.hpp =============
#pragma once
#include "provider/embedding_provider.hpp"
#include "concurrency/thread_pool.hpp"
#include <chrono>
#include <memory>

namespace rollcall {

/*
 * Decorador: ejecuta extract() del provider interno en el pool de
 * provider y espera como máximo `timeout`. Al expirar lanza
 * ProviderTimeout y marca la tarea como abandonada:
 *   - si aún no empezó, se descarta sin llamar al provider
 *   - si ya corre, termina y su resultado se descarta
 * Con max_queued > 0, más de max_queued tareas en cola -> ProviderTimeout
 * inmediato (sin encolar).
 */
class TimedEmbeddingProvider : public EmbeddingProvider {
public:
    TimedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                           ThreadPool& pool,
                           std::chrono::milliseconds timeout,
                           size_t max_queued = 0);

    std::vector<DetectedFace> extract(const std::string& image_bytes) override;

    int dimension() const override { return inner->dimension(); }
    std::string name() const override { return inner->name(); }

private:
    std::shared_ptr<EmbeddingProvider> inner;
    ThreadPool& pool;
    std::chrono::milliseconds timeout;
    size_t max_queued;
};

}  // namespace rollcall
