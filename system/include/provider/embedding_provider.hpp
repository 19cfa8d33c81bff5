// ============= include/provider/embedding_provider.hpp =============
#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace rollcall {

struct DetectedFace {
    std::vector<float> embedding;
    cv::Rect box;
    float score = 0.0f;
};

/*
 * Proveedor externo de embeddings (caja negra).
 *
 * extract():
 *   - bytes de imagen codificada (JPEG/PNG/...) -> 0..N caras
 *   - vector vacío si no hay caras
 *   - DecodeError si la imagen no se puede decodificar
 *   - ProviderError ante fallos internos del modelo
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::vector<DetectedFace> extract(const std::string& image_bytes) = 0;

    virtual int dimension() const = 0;
    virtual std::string name() const = 0;
};

}  // namespace rollcall
