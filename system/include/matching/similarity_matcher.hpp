// ============= include/matching/similarity_matcher.hpp =============
/*
 * Similarity Matcher
 *
 * Coseno entre el query y cada identidad del snapshot.
 * Función pura: sin estado, sin locks, segura para fan-out.
 */

#pragma once
#include "gallery/embedding_gallery.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

enum class MatchReason {
    Accepted,
    BelowThreshold,
    AmbiguousMatch,
    EmptyGallery
};

const char* to_string(MatchReason reason);

struct MatchResult {
    std::optional<std::string> identity_id;
    std::optional<std::string> display_name;
    float similarity = 0.0f;     // mejor similitud observada (0 si galería vacía)
    bool accepted = false;
    MatchReason reason = MatchReason::EmptyGallery;
};

struct RankedSimilarity {
    std::string identity_id;
    std::string display_name;
    float similarity;
    bool match;
};

class SimilarityMatcher {
public:
    // Empates dentro de esta tolerancia cuentan como ambiguos
    static constexpr double TIE_EPSILON = 1e-6;

    static MatchResult match(const std::vector<float>& query,
                             const GallerySnapshot& snapshot,
                             float threshold);

    // Lista completa, ordenada por similitud descendente
    static std::vector<RankedSimilarity> rank(const std::vector<float>& query,
                                              const GallerySnapshot& snapshot,
                                              float threshold);

    // cos(a, b) en [-1, 1]; InvalidEmbedding si algún vector tiene norma 0
    // o las dimensiones no coinciden
    static float cosine(const std::vector<float>& a, const std::vector<float>& b);

private:
    static double norm_of(const std::vector<float>& v);
    static void check_query(const std::vector<float>& query, const GallerySnapshot& snapshot, float threshold);
    static double similarity_to(const std::vector<float>& query, double query_norm, const GalleryEntry& entry);
};

}  // namespace rollcall
