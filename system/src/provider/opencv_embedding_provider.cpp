// ============= src/provider/opencv_embedding_provider.cpp =============
#include "provider/opencv_embedding_provider.hpp"
#include "core/errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>

namespace rollcall {

OpenCvEmbeddingProvider::OpenCvEmbeddingProvider(const OpenCvProviderOptions& options) {
    spdlog::info("🎭 Inicializando OpenCV Embedding Provider");
    spdlog::info("   Detector:   {}", options.detector_model);
    spdlog::info("   Recognizer: {}", options.recognizer_model);

    for (const auto& path : {options.detector_model, options.recognizer_model}) {
        if (!std::filesystem::exists(path)) {
            throw ProviderError("Model not found: " + path);
        }
    }

    try {
        detector = cv::FaceDetectorYN::create(options.detector_model, "", cv::Size(320, 320),
                                              options.score_threshold, options.nms_threshold,
                                              options.top_k);
        recognizer = cv::FaceRecognizerSF::create(options.recognizer_model, "");
    } catch (const cv::Exception& e) {
        throw ProviderError(std::string("Failed to load models: ") + e.what());
    }

    if (detector.empty() || recognizer.empty()) {
        throw ProviderError("Failed to load face models");
    }

    spdlog::info("✓ Provider ready (dim={}, score>={:.2f})", EMBEDDING_DIM, options.score_threshold);
}

std::vector<float> OpenCvEmbeddingProvider::l2_normalize(const cv::Mat& feature) {
    cv::Mat flat = feature.reshape(1, 1);
    cv::Mat f32;
    flat.convertTo(f32, CV_32F);

    std::vector<float> emb(f32.begin<float>(), f32.end<float>());

    double norm = 0.0;
    for (float v : emb) norm += static_cast<double>(v) * v;
    norm = std::sqrt(norm);
    if (norm > 1e-12) {
        for (auto& v : emb) v = static_cast<float>(v / norm);
    }
    return emb;
}

std::vector<DetectedFace> OpenCvEmbeddingProvider::extract(const std::string& image_bytes) {
    if (image_bytes.empty()) {
        throw DecodeError("Empty image payload");
    }

    std::vector<uchar> buffer(image_bytes.begin(), image_bytes.end());
    cv::Mat frame = cv::imdecode(buffer, cv::IMREAD_COLOR);
    if (frame.empty()) {
        throw DecodeError("Invalid image format");
    }

    std::vector<DetectedFace> result;

    std::lock_guard<std::mutex> lock(model_mutex);
    try {
        cv::Mat faces;
        detector->setInputSize(frame.size());
        detector->detect(frame, faces);

        // faces: N x 15 -> [x, y, w, h, 10 landmarks, score]
        for (int i = 0; i < faces.rows; ++i) {
            cv::Mat aligned, feature;
            recognizer->alignCrop(frame, faces.row(i), aligned);
            recognizer->feature(aligned, feature);

            DetectedFace face;
            face.embedding = l2_normalize(feature);
            face.box = cv::Rect(static_cast<int>(faces.at<float>(i, 0)),
                                static_cast<int>(faces.at<float>(i, 1)),
                                static_cast<int>(faces.at<float>(i, 2)),
                                static_cast<int>(faces.at<float>(i, 3)));
            face.score = faces.at<float>(i, 14);
            result.push_back(std::move(face));
        }
    } catch (const cv::Exception& e) {
        throw ProviderError(std::string("OpenCV inference failed: ") + e.what());
    }

    spdlog::debug("Provider: {} face(s) in {}x{} frame", result.size(), frame.cols, frame.rows);
    return result;
}

}  // namespace rollcall
