#include "config/config.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace rollcall {

ServiceConfig load_service_config(const SimpleToml& toml) {
    ServiceConfig config;

    config.server.host = toml.get("server.host", Defaults::HOST);
    config.server.port = toml.get_int("server.port", Defaults::PORT);
    config.server.threads = toml.get_int("server.threads", Defaults::SERVER_THREADS);

    config.db_path = toml.get("database.path", Defaults::DB_PATH);

    config.match_threshold = toml.get_float("recognition.threshold", Defaults::MATCH_THRESHOLD);
    config.embedding_dim = toml.get_int("recognition.embedding_dim", Defaults::EMBEDDING_DIM);

    config.cooldown = std::chrono::seconds(
        toml.get_int("attendance.cooldown_sec", Defaults::COOLDOWN_SEC));

    try {
        config.office.login_minute = parse_optional_clock_time(
            toml.get("office.login_time", Defaults::OFFICE_LOGIN_TIME));
        config.office.logout_minute = parse_optional_clock_time(
            toml.get("office.logout_time", Defaults::OFFICE_LOGOUT_TIME));
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(std::string("office: ") + e.what());
    }
    config.office.grace_minutes = toml.get_int("office.grace_min", Defaults::OFFICE_GRACE_MIN);

    config.provider.detector_model = toml.get("provider.detector_model", Defaults::DETECTOR_MODEL);
    config.provider.recognizer_model = toml.get("provider.recognizer_model", Defaults::RECOGNIZER_MODEL);
    config.provider.score_threshold = toml.get_float("provider.score_threshold", Defaults::DETECTOR_SCORE_THRESHOLD);
    config.provider.nms_threshold = toml.get_float("provider.nms_threshold", Defaults::DETECTOR_NMS_THRESHOLD);
    config.provider.top_k = toml.get_int("provider.top_k", Defaults::DETECTOR_TOP_K);
    config.provider.timeout = std::chrono::milliseconds(
        toml.get_int("provider.timeout_ms", Defaults::PROVIDER_TIMEOUT_MS));
    config.provider.threads = toml.get_int("provider.threads", Defaults::PROVIDER_THREADS);
    config.provider.max_queued = toml.get_int("provider.max_queued", Defaults::PROVIDER_MAX_QUEUED);

    config.max_pending_frames = toml.get_int("streaming.max_pending_frames", Defaults::MAX_PENDING_FRAMES);
    config.session_threads = toml.get_int("streaming.session_threads", Defaults::SESSION_THREADS);
    config.matcher_threads = toml.get_int("matcher.threads", Defaults::MATCHER_THREADS);

    config.log_level = toml.get("logging.level", Defaults::LOG_LEVEL);

    if (config.match_threshold < 0.0f || config.match_threshold > 1.0f) {
        throw std::invalid_argument("recognition.threshold must be in [0, 1]");
    }
    if (config.embedding_dim <= 0) {
        throw std::invalid_argument("recognition.embedding_dim must be positive");
    }
    if (config.cooldown.count() < 0) {
        throw std::invalid_argument("attendance.cooldown_sec must be >= 0");
    }
    if (config.office.grace_minutes < 0) {
        throw std::invalid_argument("office.grace_min must be >= 0");
    }
    if (config.provider.timeout.count() <= 0) {
        throw std::invalid_argument("provider.timeout_ms must be positive");
    }
    if (config.provider.max_queued < 0) {
        throw std::invalid_argument("provider.max_queued must be >= 0");
    }
    if (config.max_pending_frames < 1) {
        throw std::invalid_argument("streaming.max_pending_frames must be >= 1");
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        throw std::invalid_argument("server.port out of range");
    }

    return config;
}

void log_service_config(const ServiceConfig& config) {
    spdlog::info("⚙️  Configuración");
    spdlog::info("   Server: {}:{} ({} threads)", config.server.host, config.server.port, config.server.threads);
    spdlog::info("   Database: {}", config.db_path);
    spdlog::info("   Threshold: {:.2f} | Embedding dim: {}", config.match_threshold, config.embedding_dim);
    spdlog::info("   Cooldown: {}s", config.cooldown.count());
    if (config.office.login_minute || config.office.logout_minute) {
        spdlog::info("   Office: login {} | logout {} | grace {}min",
                     config.office.login_minute ? format_clock_time(*config.office.login_minute) : "-",
                     config.office.logout_minute ? format_clock_time(*config.office.logout_minute) : "-",
                     config.office.grace_minutes);
    }
    spdlog::info("   Detector: {}", config.provider.detector_model);
    spdlog::info("   Recognizer: {}", config.provider.recognizer_model);
    spdlog::info("   Provider timeout: {}ms ({} threads, max {} queued)", config.provider.timeout.count(),
                 config.provider.threads, config.provider.max_queued);
    spdlog::info("   Streaming: max {} pending frames/session, {} session threads, {} matcher threads",
                 config.max_pending_frames, config.session_threads, config.matcher_threads);
}

}  // namespace rollcall
