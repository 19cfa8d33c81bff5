// ============= include/streaming/wire_codec.hpp =============
/*
 * Formato JSON del canal de streaming y de la API HTTP
 *
 * Entrada (WebSocket):
 *   {"image": "data:image/jpeg;base64,....", "entry_type": "entry"|"exit"}
 *   {"type": "ping"}
 *
 * Salida:
 *   single   {message, user_id, name, timestamp?, similarity}
 *   multiple {multiple_users: true, users: [...]}
 *   error    {error}
 *   no face  {status: "no_face_detected", message}
 */

#pragma once
#include "pipeline/attendance_pipeline.hpp"
#include <json/json.h>
#include <optional>
#include <string>

namespace rollcall {
namespace wire {

enum class InboundKind {
    Frame,
    Ping
};

struct InboundMessage {
    InboundKind kind = InboundKind::Frame;
    std::string image_bytes;
    EventType event_type = EventType::Entry;
};

// DecodeError si el JSON, el data-URL o el entry_type no son válidos
InboundMessage parse_inbound(const std::string& text);

// Acepta "data:<mime>;base64,<payload>" o base64 pelado
std::string decode_data_url(const std::string& data_url);

Json::Value face_json(const FaceResult& face);
Json::Value response_json(const FrameResponse& response);

Json::Value error_json(const std::string& message);
Json::Value busy_json();
Json::Value pong_json();
Json::Value no_face_json();

Json::Value attendance_update_json(const AttendanceEvent& event,
                                   const std::string& display_name,
                                   const std::optional<Punctuality>& punctuality = std::nullopt);

// is_late / minutes_late / late_message o is_early_exit / early_exit_message
void add_punctuality(Json::Value& json, EventType type, const Punctuality& punctuality);

// {login_time, logout_time, grace_minutes}; null si no está configurado
Json::Value office_timings_json(const OfficeTimings& timings);
Json::Value diagnostic_json(const DiagnosticResult& result);
Json::Value identity_json(const Identity& identity);
Json::Value event_json(const AttendanceEvent& event);

// Compacto, una línea
std::string serialize(const Json::Value& value);

// Texto para el campo "message" de una cara
std::string face_message(const FaceResult& face);

}  // namespace wire
}  // namespace rollcall
