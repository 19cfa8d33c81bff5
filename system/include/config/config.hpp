#pragma once
#include "attendance/office_policy.hpp"
#include "config/simple_toml.hpp"
#include <chrono>
#include <string>

namespace rollcall {

namespace Defaults {

    // Server
    constexpr const char* HOST = "0.0.0.0";
    constexpr int PORT = 8000;
    constexpr int SERVER_THREADS = 4;

    // Storage
    constexpr const char* DB_PATH = "database/attendance.db";

    // Recognition
    constexpr float MATCH_THRESHOLD = 0.6f;
    constexpr int EMBEDDING_DIM = 128;   // SFace

    // Attendance
    constexpr int COOLDOWN_SEC = 300;

    // Horario de oficina ("" = sin horario)
    constexpr const char* OFFICE_LOGIN_TIME = "";
    constexpr const char* OFFICE_LOGOUT_TIME = "";
    constexpr int OFFICE_GRACE_MIN = 60;

    // Provider (OpenCV YuNet + SFace)
    constexpr const char* DETECTOR_MODEL = "models/face_detection_yunet_2023mar.onnx";
    constexpr const char* RECOGNIZER_MODEL = "models/face_recognition_sface_2021dec.onnx";
    constexpr float DETECTOR_SCORE_THRESHOLD = 0.9f;
    constexpr float DETECTOR_NMS_THRESHOLD = 0.3f;
    constexpr int DETECTOR_TOP_K = 5000;
    constexpr int PROVIDER_TIMEOUT_MS = 5000;
    constexpr int PROVIDER_THREADS = 2;
    constexpr int PROVIDER_MAX_QUEUED = 8;

    // Streaming
    constexpr int MAX_PENDING_FRAMES = 2;
    constexpr int SESSION_THREADS = 4;
    constexpr int MATCHER_THREADS = 4;

    constexpr const char* LOG_LEVEL = "info";
}

struct ServiceConfig {
    struct Server {
        std::string host = Defaults::HOST;
        int port = Defaults::PORT;
        int threads = Defaults::SERVER_THREADS;
    } server;

    std::string db_path = Defaults::DB_PATH;

    float match_threshold = Defaults::MATCH_THRESHOLD;
    int embedding_dim = Defaults::EMBEDDING_DIM;

    std::chrono::seconds cooldown{Defaults::COOLDOWN_SEC};

    OfficeTimings office;

    struct Provider {
        std::string detector_model = Defaults::DETECTOR_MODEL;
        std::string recognizer_model = Defaults::RECOGNIZER_MODEL;
        float score_threshold = Defaults::DETECTOR_SCORE_THRESHOLD;
        float nms_threshold = Defaults::DETECTOR_NMS_THRESHOLD;
        int top_k = Defaults::DETECTOR_TOP_K;
        std::chrono::milliseconds timeout{Defaults::PROVIDER_TIMEOUT_MS};
        int threads = Defaults::PROVIDER_THREADS;
        int max_queued = Defaults::PROVIDER_MAX_QUEUED;
    } provider;

    int max_pending_frames = Defaults::MAX_PENDING_FRAMES;
    int session_threads = Defaults::SESSION_THREADS;
    int matcher_threads = Defaults::MATCHER_THREADS;

    std::string log_level = Defaults::LOG_LEVEL;
};

// Lee todas las claves conocidas; las ausentes quedan en su default.
// Valores fuera de rango -> std::invalid_argument
ServiceConfig load_service_config(const SimpleToml& toml);

void log_service_config(const ServiceConfig& config);

}  // namespace rollcall
