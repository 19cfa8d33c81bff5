// ============= include/provider/opencv_embedding_provider.hpp =============
/*
 * Provider OpenCV: YuNet (detección) + SFace (embedding 128-D)
 *
 * - cv::imdecode sobre los bytes recibidos
 * - FaceDetectorYN con input size = tamaño del frame
 * - alignCrop + feature por cada cara, embedding L2-normalizado
 * - Las redes DNN no son thread-safe: un mutex serializa extract()
 */

#pragma once
#include "provider/embedding_provider.hpp"
#include <opencv2/objdetect/face.hpp>
#include <mutex>

namespace rollcall {

struct OpenCvProviderOptions {
    std::string detector_model;
    std::string recognizer_model;
    float score_threshold = 0.9f;
    float nms_threshold = 0.3f;
    int top_k = 5000;
};

class OpenCvEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OpenCvEmbeddingProvider(const OpenCvProviderOptions& options);

    std::vector<DetectedFace> extract(const std::string& image_bytes) override;

    int dimension() const override { return EMBEDDING_DIM; }
    std::string name() const override { return "opencv-yunet-sface"; }

    static constexpr int EMBEDDING_DIM = 128;

private:
    cv::Ptr<cv::FaceDetectorYN> detector;
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    std::mutex model_mutex;

    static std::vector<float> l2_normalize(const cv::Mat& feature);
};

}  // namespace rollcall
