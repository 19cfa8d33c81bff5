// ============= src/matching/similarity_matcher.cpp =============
#include "matching/similarity_matcher.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rollcall {

const char* to_string(MatchReason reason) {
    switch (reason) {
        case MatchReason::Accepted:       return "accepted";
        case MatchReason::BelowThreshold: return "below_threshold";
        case MatchReason::AmbiguousMatch: return "ambiguous_match";
        case MatchReason::EmptyGallery:   return "empty_gallery";
    }
    return "unknown";
}

double SimilarityMatcher::norm_of(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return std::sqrt(sum);
}

float SimilarityMatcher::cosine(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw InvalidEmbedding("Dimension mismatch: " + std::to_string(a.size()) +
                               " vs " + std::to_string(b.size()));
    }

    double na = norm_of(a);
    double nb = norm_of(b);
    if (na == 0.0 || nb == 0.0) {
        throw InvalidEmbedding("Zero-norm embedding");
    }

    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) dot += static_cast<double>(a[i]) * b[i];

    return static_cast<float>(std::clamp(dot / (na * nb), -1.0, 1.0));
}

void SimilarityMatcher::check_query(const std::vector<float>& query,
                                    const GallerySnapshot& snapshot,
                                    float threshold) {
    if (!(threshold >= 0.0f && threshold <= 1.0f)) {
        throw std::invalid_argument("threshold must be in [0, 1]");
    }
    if (query.size() != static_cast<size_t>(snapshot.dimension())) {
        throw InvalidEmbedding("Query dimension " + std::to_string(query.size()) +
                               " != gallery dimension " + std::to_string(snapshot.dimension()));
    }
}

double SimilarityMatcher::similarity_to(const std::vector<float>& query,
                                        double query_norm,
                                        const GalleryEntry& entry) {
    double dot = 0.0;
    for (size_t i = 0; i < query.size(); ++i) {
        dot += static_cast<double>(query[i]) * entry.embedding[i];
    }
    return std::clamp(dot / (query_norm * entry.norm), -1.0, 1.0);
}

MatchResult SimilarityMatcher::match(const std::vector<float>& query,
                                     const GallerySnapshot& snapshot,
                                     float threshold) {
    check_query(query, snapshot, threshold);

    double qnorm = norm_of(query);
    if (qnorm == 0.0) {
        throw InvalidEmbedding("Zero-norm query embedding");
    }

    MatchResult result;
    if (snapshot.empty()) {
        result.reason = MatchReason::EmptyGallery;
        return result;
    }

    const GalleryEntry* best = nullptr;
    double best_sim = -2.0;
    int ties = 0;

    for (const auto& entry : snapshot.entries()) {
        double sim = similarity_to(query, qnorm, entry);

        if (best == nullptr || sim > best_sim + TIE_EPSILON) {
            best = &entry;
            best_sim = sim;
            ties = 1;
        } else if (std::abs(sim - best_sim) <= TIE_EPSILON) {
            ties++;
            if (sim > best_sim) {
                best = &entry;
                best_sim = sim;
            }
        }
    }

    result.similarity = static_cast<float>(best_sim);

    if (best_sim < threshold) {
        result.reason = MatchReason::BelowThreshold;
        return result;
    }

    if (ties > 1) {
        result.reason = MatchReason::AmbiguousMatch;
        return result;
    }

    result.identity_id = best->identity_id;
    result.display_name = best->display_name;
    result.accepted = true;
    result.reason = MatchReason::Accepted;
    return result;
}

std::vector<RankedSimilarity> SimilarityMatcher::rank(const std::vector<float>& query,
                                                      const GallerySnapshot& snapshot,
                                                      float threshold) {
    check_query(query, snapshot, threshold);

    double qnorm = norm_of(query);
    if (qnorm == 0.0) {
        throw InvalidEmbedding("Zero-norm query embedding");
    }

    std::vector<RankedSimilarity> rows;
    rows.reserve(snapshot.size());
    for (const auto& entry : snapshot.entries()) {
        // Mismo criterio que match(): comparación en double
        double sim = similarity_to(query, qnorm, entry);
        rows.push_back({entry.identity_id, entry.display_name, static_cast<float>(sim), sim >= threshold});
    }

    std::sort(rows.begin(), rows.end(), [](const RankedSimilarity& a, const RankedSimilarity& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.identity_id < b.identity_id;
    });
    return rows;
}

}  // namespace rollcall
