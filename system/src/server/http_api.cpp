// ============= src/server/http_api.cpp =============
#include "server/http_api.hpp"
#include "core/errors.hpp"
#include "streaming/wire_codec.hpp"
#include <drogon/HttpAppFramework.h>
#include <drogon/MultiPart.h>
#include <spdlog/spdlog.h>

namespace rollcall {

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
using drogon::HttpStatusCode;
using Callback = HttpApi::Callback;

HttpApi::HttpApi(AttendancePipeline& pipeline,
                 IdentityRegistry& registry,
                 SessionManager& sessions,
                 EmbeddingGallery& gallery,
                 Deduplicator& deduplicator,
                 OfficePolicy& office,
                 ThreadPool& workers)
    : pipeline(pipeline), registry(registry), sessions(sessions),
      gallery(gallery), deduplicator(deduplicator), office(office), workers(workers)
{
}

// ==================== HELPERS ====================

bool HttpApi::parse_multipart(const HttpRequestPtr& req, MultipartForm& form) {
    drogon::MultiPartParser parser;
    if (parser.parse(req) != 0) {
        return false;
    }

    for (const auto& file : parser.getFiles()) {
        form.files[file.getItemName()] = std::string(file.fileData(), file.fileLength());
    }
    for (const auto& [key, value] : parser.getParameters()) {
        form.fields[key] = value;
    }
    return true;
}

std::map<std::string, std::string> HttpApi::form_fields(const HttpRequestPtr& req) {
    MultipartForm form;
    if (parse_multipart(req, form)) {
        return form.fields;
    }
    // application/x-www-form-urlencoded
    std::map<std::string, std::string> fields;
    for (const auto& [key, value] : req->getParameters()) {
        fields[key] = value;
    }
    return fields;
}

bool HttpApi::run_on_workers(std::function<void()> task, const Callback& callback) {
    try {
        workers.post(std::move(task));
        return true;
    } catch (const std::runtime_error& e) {
        spdlog::warn("Request rejected: {}", e.what());
        callback(json_response(wire::error_json("Server is shutting down"), drogon::k503ServiceUnavailable));
        return false;
    }
}

OfficeTimings HttpApi::merge_office_form(const std::map<std::string, std::string>& fields,
                                         const OfficeTimings& current) {
    OfficeTimings timings = current;

    auto it = fields.find("login_time");
    if (it != fields.end()) timings.login_minute = parse_optional_clock_time(it->second);

    it = fields.find("logout_time");
    if (it != fields.end()) timings.logout_minute = parse_optional_clock_time(it->second);

    it = fields.find("grace_min");
    if (it != fields.end()) {
        try {
            timings.grace_minutes = std::stoi(it->second);
        } catch (const std::exception&) {
            throw std::invalid_argument("grace_min must be an integer");
        }
        if (timings.grace_minutes < 0) {
            throw std::invalid_argument("grace_min must be >= 0");
        }
    }
    return timings;
}

HttpResponsePtr HttpApi::json_response(const Json::Value& body, HttpStatusCode code) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(code);
    return resp;
}

HttpResponsePtr HttpApi::detail_response(const std::string& detail, HttpStatusCode code) {
    Json::Value body;
    body["detail"] = detail;
    return json_response(body, code);
}

HttpStatusCode HttpApi::status_for(const FrameResponse& response) {
    if (std::holds_alternative<NoFaceResponse>(response)) {
        return drogon::k400BadRequest;
    }
    if (auto error = std::get_if<ErrorResponse>(&response)) {
        switch (error->kind) {
            case ErrorKind::Decode:          return drogon::k400BadRequest;
            case ErrorKind::ProviderTimeout: return drogon::k504GatewayTimeout;
            case ErrorKind::Cancelled:       return drogon::k503ServiceUnavailable;
            case ErrorKind::Provider:
            case ErrorKind::Internal:        return drogon::k500InternalServerError;
        }
    }
    return drogon::k200OK;
}

// ==================== ROUTES ====================

void HttpApi::register_routes() {
    auto& app = drogon::app();

    // ---- Captura single-shot ----
    app.registerHandler(
        "/attendance",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            MultipartForm form;
            if (!parse_multipart(req, form) || !form.files.count("image")) {
                callback(json_response(wire::error_json("No image data received"), drogon::k400BadRequest));
                return;
            }

            EventType type = EventType::Entry;
            auto it = form.fields.find("entry_type");
            if (it != form.fields.end()) {
                try {
                    type = parse_event_type(it->second);
                } catch (const std::invalid_argument& e) {
                    callback(json_response(wire::error_json(e.what()), drogon::k400BadRequest));
                    return;
                }
            }

            auto bytes = std::make_shared<std::string>(std::move(form.files["image"]));
            run_on_workers([this, bytes, type, callback]() {
                FrameResponse response = pipeline.capture(*bytes, type);
                callback(json_response(wire::response_json(response), status_for(response)));
            }, callback);
        },
        {drogon::Post});

    // ---- Diagnóstico ----
    app.registerHandler(
        "/debug/face-recognition",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            MultipartForm form;
            if (!parse_multipart(req, form) || !form.files.count("image")) {
                callback(detail_response("No image data received", drogon::k400BadRequest));
                return;
            }

            float threshold = pipeline.threshold();
            auto it = form.fields.find("threshold");
            if (it != form.fields.end()) {
                try {
                    threshold = std::stof(it->second);
                } catch (const std::exception&) {
                    callback(detail_response("threshold must be a number", drogon::k400BadRequest));
                    return;
                }
            }

            auto bytes = std::make_shared<std::string>(std::move(form.files["image"]));
            run_on_workers([this, bytes, threshold, callback]() {
                try {
                    auto result = pipeline.diagnose(*bytes, threshold);
                    callback(json_response(wire::diagnostic_json(result), drogon::k200OK));
                } catch (const NoFaceDetected& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const DecodeError& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const std::invalid_argument& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const ProviderTimeout& e) {
                    callback(detail_response(e.what(), drogon::k504GatewayTimeout));
                } catch (const std::exception& e) {
                    spdlog::error("Diagnostic failed: {}", e.what());
                    callback(detail_response(e.what(), drogon::k500InternalServerError));
                }
            }, callback);
        },
        {drogon::Post});

    // ---- Registro ----
    app.registerHandler(
        "/register",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            MultipartForm form;
            if (!parse_multipart(req, form) || !form.files.count("image")) {
                callback(detail_response("No image data received", drogon::k400BadRequest));
                return;
            }

            auto user_id = form.fields["user_id"];
            auto name = form.fields["name"];
            auto bytes = std::make_shared<std::string>(std::move(form.files["image"]));

            run_on_workers([this, bytes, user_id, name, callback]() {
                try {
                    auto identity = registry.register_identity(user_id, name, *bytes);
                    Json::Value body;
                    body["message"] = "User registered successfully";
                    body["user_id"] = identity.identity_id;
                    body["name"] = identity.display_name;
                    callback(json_response(body, drogon::k200OK));
                } catch (const NoFaceDetected& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const DecodeError& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const InvalidIdentity& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const InvalidEmbedding& e) {
                    callback(detail_response(e.what(), drogon::k400BadRequest));
                } catch (const ProviderTimeout& e) {
                    callback(detail_response(e.what(), drogon::k504GatewayTimeout));
                } catch (const std::exception& e) {
                    spdlog::error("Register '{}' failed: {}", user_id, e.what());
                    callback(detail_response(e.what(), drogon::k500InternalServerError));
                }
            }, callback);
        },
        {drogon::Post});

    // ---- Identidades ----
    app.registerHandler(
        "/users",
        [this](const HttpRequestPtr&, Callback&& callback) {
            try {
                Json::Value body(Json::arrayValue);
                for (const auto& identity : registry.list_identities()) {
                    body.append(wire::identity_json(identity));
                }
                callback(json_response(body, drogon::k200OK));
            } catch (const std::exception& e) {
                spdlog::error("List users failed: {}", e.what());
                callback(detail_response(e.what(), drogon::k500InternalServerError));
            }
        },
        {drogon::Get});

    app.registerHandler(
        "/users/{1}",
        [this](const HttpRequestPtr&, Callback&& callback, const std::string& user_id) {
            try {
                if (!registry.remove_identity(user_id)) {
                    callback(detail_response("User not found", drogon::k404NotFound));
                    return;
                }
                Json::Value body;
                body["message"] = "User deleted successfully";
                callback(json_response(body, drogon::k200OK));
            } catch (const std::exception& e) {
                spdlog::error("Delete user '{}' failed: {}", user_id, e.what());
                callback(detail_response(e.what(), drogon::k500InternalServerError));
            }
        },
        {drogon::Delete});

    // ---- Eventos ----
    app.registerHandler(
        "/attendance",
        [this](const HttpRequestPtr&, Callback&& callback) {
            try {
                auto events = registry.list_events();
                Json::Value body(Json::arrayValue);
                // Más recientes primero
                for (auto it = events.rbegin(); it != events.rend(); ++it) {
                    body.append(wire::event_json(*it));
                }
                callback(json_response(body, drogon::k200OK));
            } catch (const std::exception& e) {
                spdlog::error("List attendance failed: {}", e.what());
                callback(detail_response(e.what(), drogon::k500InternalServerError));
            }
        },
        {drogon::Get});

    app.registerHandler(
        "/attendance/{1}",
        [this](const HttpRequestPtr&, Callback&& callback, const std::string& id_text) {
            int64_t event_id = 0;
            try {
                event_id = std::stoll(id_text);
            } catch (const std::exception&) {
                callback(detail_response("Invalid attendance id", drogon::k400BadRequest));
                return;
            }

            try {
                if (!registry.delete_event(event_id)) {
                    callback(detail_response("Attendance record not found", drogon::k404NotFound));
                    return;
                }
                Json::Value body;
                body["message"] = "Attendance record deleted successfully";
                callback(json_response(body, drogon::k200OK));
            } catch (const std::exception& e) {
                spdlog::error("Delete attendance {} failed: {}", event_id, e.what());
                callback(detail_response(e.what(), drogon::k500InternalServerError));
            }
        },
        {drogon::Delete});

    // ---- Horario de oficina ----
    app.registerHandler(
        "/office-timings",
        [this](const HttpRequestPtr&, Callback&& callback) {
            callback(json_response(wire::office_timings_json(office.timings()), drogon::k200OK));
        },
        {drogon::Get});

    app.registerHandler(
        "/office-timings",
        [this](const HttpRequestPtr& req, Callback&& callback) {
            try {
                OfficeTimings timings = merge_office_form(form_fields(req), office.timings());
                office.set_timings(timings);

                Json::Value body = wire::office_timings_json(timings);
                body["message"] = "Office timings updated successfully";
                callback(json_response(body, drogon::k200OK));
            } catch (const std::invalid_argument& e) {
                callback(detail_response(e.what(), drogon::k400BadRequest));
            }
        },
        {drogon::Post});

    // ---- Health ----
    app.registerHandler(
        "/health",
        [this](const HttpRequestPtr&, Callback&& callback) {
            Json::Value body;
            body["status"] = "ok";
            body["gallery_size"] = static_cast<Json::UInt64>(gallery.size());
            body["embedding_dim"] = gallery.dimension();
            body["active_sessions"] = static_cast<Json::UInt64>(sessions.active_count());
            body["cooldown_sec"] = static_cast<Json::Int64>(deduplicator.cooldown().count());
            body["threshold"] = pipeline.threshold();
            body["office_policy"] = office.enabled();
            callback(json_response(body, drogon::k200OK));
        },
        {drogon::Get});

    spdlog::info("✓ HTTP routes registered");
}

}  // namespace rollcall
