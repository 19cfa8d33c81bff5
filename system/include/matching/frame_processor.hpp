// ============= include/matching/frame_processor.hpp =============
#pragma once
#include "matching/similarity_matcher.hpp"
#include "concurrency/thread_pool.hpp"
#include <vector>

namespace rollcall {

/*
 * Un MatchResult por query, en el mismo orden de entrada.
 * Sin deduplicación ni persistencia.
 *
 * Con más de un query el trabajo se reparte en el pool de matching;
 * con uno solo se resuelve en el thread del llamador.
 */
class FrameProcessor {
public:
    // pool puede ser nullptr -> todo inline
    explicit FrameProcessor(ThreadPool* pool = nullptr) : pool(pool) {}

    std::vector<MatchResult> process(const std::vector<std::vector<float>>& queries,
                                     const GallerySnapshotPtr& snapshot,
                                     float threshold) const;

private:
    ThreadPool* pool;
};

}  // namespace rollcall
