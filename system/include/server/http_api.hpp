// ============= include/server/http_api.hpp =============
/*
 * Rutas HTTP (Drogon)
 *
 *   POST   /attendance                multipart: image, entry_type
 *   POST   /debug/face-recognition    multipart: image, threshold (0.6)
 *   POST   /register                  multipart: user_id, name, image
 *   GET    /users
 *   DELETE /users/{id}
 *   GET    /attendance
 *   DELETE /attendance/{id}
 *   GET    /office-timings
 *   POST   /office-timings            form: login_time, logout_time, grace_min
 *   GET    /health
 *
 * El trabajo con imágenes corre en el pool de workers, no en los
 * threads de I/O de Drogon. Pool detenido -> 503.
 */

#pragma once
#include "pipeline/attendance_pipeline.hpp"
#include "pipeline/identity_registry.hpp"
#include "streaming/session_manager.hpp"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <functional>
#include <json/json.h>
#include <map>
#include <string>

namespace rollcall {

struct MultipartForm {
    std::map<std::string, std::string> fields;
    std::map<std::string, std::string> files;   // nombre del campo -> bytes
};

class HttpApi {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    HttpApi(AttendancePipeline& pipeline,
            IdentityRegistry& registry,
            SessionManager& sessions,
            EmbeddingGallery& gallery,
            Deduplicator& deduplicator,
            OfficePolicy& office,
            ThreadPool& workers);

    void register_routes();

    // Encola `task` en el pool de workers. Si el pool no acepta tareas
    // responde 503 por `callback` y devuelve false
    bool run_on_workers(std::function<void()> task, const Callback& callback);

    // Aplica login_time / logout_time / grace_min sobre el horario actual.
    // std::invalid_argument si algún campo no es válido
    static OfficeTimings merge_office_form(const std::map<std::string, std::string>& fields,
                                           const OfficeTimings& current);

    // HTTP status para una respuesta del pipeline
    static drogon::HttpStatusCode status_for(const FrameResponse& response);

private:
    AttendancePipeline& pipeline;
    IdentityRegistry& registry;
    SessionManager& sessions;
    EmbeddingGallery& gallery;
    Deduplicator& deduplicator;
    OfficePolicy& office;
    ThreadPool& workers;

    static bool parse_multipart(const drogon::HttpRequestPtr& req, MultipartForm& form);
    static std::map<std::string, std::string> form_fields(const drogon::HttpRequestPtr& req);
    static drogon::HttpResponsePtr json_response(const Json::Value& body, drogon::HttpStatusCode code);
    static drogon::HttpResponsePtr detail_response(const std::string& detail, drogon::HttpStatusCode code);
};

}  // namespace rollcall
