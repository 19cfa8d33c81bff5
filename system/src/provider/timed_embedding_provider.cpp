// ============= src/provider/timed_embedding_provider.cpp =============
#include "provider/timed_embedding_provider.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <atomic>

namespace rollcall {

TimedEmbeddingProvider::TimedEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                                               ThreadPool& pool,
                                               std::chrono::milliseconds timeout,
                                               size_t max_queued)
    : inner(std::move(inner)), pool(pool), timeout(timeout), max_queued(max_queued)
{
    if (!this->inner) {
        throw std::invalid_argument("TimedEmbeddingProvider requires a provider");
    }
}

std::vector<DetectedFace> TimedEmbeddingProvider::extract(const std::string& image_bytes) {
    if (max_queued > 0 && pool.pending_tasks() >= max_queued) {
        spdlog::warn("Provider '{}' overloaded ({} requests queued)", inner->name(), pool.pending_tasks());
        throw ProviderTimeout("Embedding provider busy (" + std::to_string(max_queued) + " requests queued)");
    }

    // La tarea puede sobrevivir a esta llamada: copia de bytes y shared_ptr
    auto provider = inner;
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    auto future = pool.submit([provider, abandoned, bytes = image_bytes]() {
        if (abandoned->load()) {
            return std::vector<DetectedFace>{};
        }
        return provider->extract(bytes);
    });

    if (future.wait_for(timeout) != std::future_status::ready) {
        abandoned->store(true);
        spdlog::warn("Provider '{}' timed out after {}ms", inner->name(), timeout.count());
        throw ProviderTimeout("Embedding provider timed out after " +
                              std::to_string(timeout.count()) + "ms");
    }

    return future.get();
}

}  // namespace rollcall
