// ============= src/matching/frame_processor.cpp =============
#include "matching/frame_processor.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <future>

namespace rollcall {

std::vector<MatchResult> FrameProcessor::process(const std::vector<std::vector<float>>& queries,
                                                 const GallerySnapshotPtr& snapshot,
                                                 float threshold) const {
    std::vector<MatchResult> results;
    if (queries.empty()) return results;

    results.reserve(queries.size());

    if (queries.size() == 1 || pool == nullptr) {
        for (const auto& query : queries) {
            results.push_back(SimilarityMatcher::match(query, *snapshot, threshold));
        }
        return results;
    }

    // Fan-out: el snapshot viaja por shared_ptr, cada tarea lo mantiene vivo
    std::vector<std::future<MatchResult>> futures;
    futures.reserve(queries.size());
    for (const auto& query : queries) {
        futures.push_back(pool->submit([&query, snapshot, threshold]() {
            return SimilarityMatcher::match(query, *snapshot, threshold);
        }));
    }

    // Esperar todas antes de propagar: las tareas referencian `queries`
    std::exception_ptr first_error;
    for (auto& f : futures) {
        try {
            results.push_back(f.get());
        } catch (const std::exception& e) {
            spdlog::debug("FrameProcessor: match failed: {}", e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }

    if (first_error) std::rethrow_exception(first_error);
    return results;
}

}  // namespace rollcall
