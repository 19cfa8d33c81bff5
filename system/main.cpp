// ============= main.cpp - ROLLCALL SERVER =============
#include "config/config.hpp"
#include "concurrency/thread_pool.hpp"
#include "attendance/sqlite_attendance_store.hpp"
#include "attendance/deduplicator.hpp"
#include "gallery/embedding_gallery.hpp"
#include "matching/frame_processor.hpp"
#include "provider/opencv_embedding_provider.hpp"
#include "provider/timed_embedding_provider.hpp"
#include "pipeline/attendance_pipeline.hpp"
#include "pipeline/identity_registry.hpp"
#include "streaming/session_manager.hpp"
#include "server/attendance_socket.hpp"
#include "server/http_api.hpp"
#include <drogon/drogon.h>
#include <spdlog/spdlog.h>
#include <memory>

using namespace rollcall;

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string config_file = argc >= 2 ? argv[1] : "config.toml";

    SimpleToml toml;
    if (!toml.load(config_file)) {
        spdlog::warn("No se pudo cargar {}, usando valores por defecto", config_file);
    }

    ServiceConfig config;
    try {
        config = load_service_config(toml);
    } catch (const std::invalid_argument& e) {
        spdlog::error("Configuración inválida: {}", e.what());
        return 1;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    log_service_config(config);

    try {
        // ---- Pools (separados: un pool nunca espera tareas de sí mismo) ----
        ThreadPool session_pool(config.session_threads, "session");
        ThreadPool matcher_pool(config.matcher_threads, "matcher");
        ThreadPool provider_pool(config.provider.threads, "provider");

        // ---- Storage + estado en memoria ----
        SqliteAttendanceStore store(config.db_path);
        EmbeddingGallery gallery(config.embedding_dim);
        Deduplicator deduplicator(store, config.cooldown);
        OfficePolicy office(config.office);

        // ---- Provider ----
        OpenCvProviderOptions provider_options;
        provider_options.detector_model = config.provider.detector_model;
        provider_options.recognizer_model = config.provider.recognizer_model;
        provider_options.score_threshold = config.provider.score_threshold;
        provider_options.nms_threshold = config.provider.nms_threshold;
        provider_options.top_k = config.provider.top_k;

        auto opencv_provider = std::make_shared<OpenCvEmbeddingProvider>(provider_options);
        if (opencv_provider->dimension() != config.embedding_dim) {
            spdlog::error("recognition.embedding_dim={} pero el provider produce {}",
                          config.embedding_dim, opencv_provider->dimension());
            return 1;
        }
        TimedEmbeddingProvider provider(opencv_provider, provider_pool, config.provider.timeout,
                                        static_cast<size_t>(config.provider.max_queued));

        // ---- Pipeline ----
        FrameProcessor processor(&matcher_pool);
        AttendancePipeline pipeline(gallery, processor, deduplicator, provider, config.match_threshold, &office);
        IdentityRegistry registry(gallery, store, deduplicator, provider);
        registry.restore();

        SessionManager sessions(pipeline, session_pool, config.max_pending_frames);

        // ---- Drogon ----
        HttpApi api(pipeline, registry, sessions, gallery, deduplicator, office, session_pool);
        // Sesiones -> matcher -> provider, antes de destruir pipeline y store
        PoolShutdown shutdown{{&session_pool, &matcher_pool, &provider_pool}};
        api.register_routes();

        drogon::app()
            .registerController(std::make_shared<AttendanceSocket>(sessions))
            .addListener(config.server.host, static_cast<uint16_t>(config.server.port))
            .setThreadNum(config.server.threads)
            .setClientMaxBodySize(20 * 1024 * 1024)
            .setClientMaxWebSocketMessageSize(20 * 1024 * 1024);

        spdlog::info("🚀 Servidor en {}:{} (ws: /ws/attendance)", config.server.host, config.server.port);
        drogon::app().run();

        spdlog::info("Deteniendo");
        sessions.close_all();

    } catch (const Error& e) {
        spdlog::error("Error fatal: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error inesperado: {}", e.what());
        return 1;
    }

    spdlog::info("✓ Servidor detenido");
    return 0;
}
