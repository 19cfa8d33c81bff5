// ============= src/streaming/wire_codec.cpp =============
#include "streaming/wire_codec.hpp"
#include "core/errors.hpp"
#include <drogon/utils/Utilities.h>
#include <memory>

namespace rollcall {
namespace wire {

namespace {

constexpr const char* BUSY_MESSAGE = "Server busy with other images";
constexpr const char* NO_FACE_MESSAGE = "No face detected in image";
constexpr const char* NO_MATCH_MESSAGE = "No matching user found";

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/' || c == '=';
}

Json::Value parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw DecodeError("Invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw DecodeError("Invalid JSON: expected an object");
    }
    return root;
}

const char* marked_word(EventType type) {
    return type == EventType::Entry ? "Entry" : "Exit";
}

}  // namespace

// ==================== INBOUND ====================

std::string decode_data_url(const std::string& data_url) {
    std::string payload = data_url;

    if (payload.rfind("data:", 0) == 0) {
        auto comma = payload.find(',');
        if (comma == std::string::npos) {
            throw DecodeError("Malformed data URL");
        }
        if (payload.substr(0, comma).find(";base64") == std::string::npos) {
            throw DecodeError("Data URL is not base64 encoded");
        }
        payload = payload.substr(comma + 1);
    }

    // El navegador puede partir líneas
    std::string clean;
    clean.reserve(payload.size());
    for (char c : payload) {
        if (c == '\r' || c == '\n' || c == ' ') continue;
        if (!is_base64_char(c)) {
            throw DecodeError("Invalid base64 payload");
        }
        clean.push_back(c);
    }

    if (clean.empty()) {
        throw DecodeError("No image data received");
    }

    std::string bytes = drogon::utils::base64Decode(clean);
    if (bytes.empty()) {
        throw DecodeError("Invalid base64 payload");
    }
    return bytes;
}

InboundMessage parse_inbound(const std::string& text) {
    Json::Value root = parse_json(text);

    InboundMessage message;

    if (root.isMember("type") && root["type"].isString() && root["type"].asString() == "ping") {
        message.kind = InboundKind::Ping;
        return message;
    }

    const Json::Value& image = root["image"];
    if (!image.isString() || image.asString().empty()) {
        throw DecodeError("No image data received");
    }

    if (root.isMember("entry_type")) {
        if (!root["entry_type"].isString()) {
            throw DecodeError("entry_type must be a string");
        }
        try {
            message.event_type = parse_event_type(root["entry_type"].asString());
        } catch (const std::invalid_argument& e) {
            throw DecodeError(e.what());
        }
    }

    message.kind = InboundKind::Frame;
    message.image_bytes = decode_data_url(image.asString());
    return message;
}

// ==================== OUTBOUND ====================

std::string face_message(const FaceResult& face) {
    switch (face.outcome) {
        case FaceOutcome::Accepted: {
            std::string message = std::string(marked_word(face.event_type)) + " marked successfully";
            if (face.punctuality && face.punctuality->is_late) {
                message += " - " + face.punctuality->late_message;
            } else if (face.punctuality && face.punctuality->is_early_exit) {
                message += " - " + face.punctuality->early_exit_message;
            }
            return message;
        }
        case FaceOutcome::AlreadyMarked:
            return std::string(marked_word(face.event_type)) + " already marked";
        case FaceOutcome::PersistFailed:
            return std::string("Failed to record ") + to_string(face.event_type);
        case FaceOutcome::Unmatched:
            break;
    }
    return NO_MATCH_MESSAGE;
}

Json::Value face_json(const FaceResult& face) {
    Json::Value json;
    json["message"] = face_message(face);

    if (face.outcome == FaceOutcome::Unmatched) {
        json["user_id"] = Json::nullValue;
        json["name"] = Json::nullValue;
        json["reason"] = to_string(face.match.reason);
    } else {
        json["user_id"] = face.match.identity_id.value_or("");
        json["name"] = face.match.display_name.value_or("");
    }

    if (face.timestamp) {
        json["timestamp"] = format_timestamp(*face.timestamp);
    }
    if (face.outcome == FaceOutcome::Accepted) {
        json["event_id"] = static_cast<Json::Int64>(face.event_id);
        if (face.punctuality) {
            add_punctuality(json, face.event_type, *face.punctuality);
        }
    }
    if (face.outcome == FaceOutcome::PersistFailed) {
        json["reason"] = to_string(DecisionReason::PersistenceFailed);
    }

    json["similarity"] = face.match.similarity;
    return json;
}

Json::Value response_json(const FrameResponse& response) {
    if (auto single = std::get_if<SingleResponse>(&response)) {
        return face_json(single->face);
    }
    if (auto multiple = std::get_if<MultipleResponse>(&response)) {
        Json::Value json;
        json["multiple_users"] = true;
        json["users"] = Json::arrayValue;
        for (const auto& face : multiple->faces) {
            json["users"].append(face_json(face));
        }
        return json;
    }
    if (auto error = std::get_if<ErrorResponse>(&response)) {
        return error_json(error->message);
    }
    return no_face_json();
}

Json::Value error_json(const std::string& message) {
    Json::Value json;
    json["error"] = message;
    return json;
}

Json::Value busy_json() {
    Json::Value json;
    json["status"] = "error";
    json["error"] = BUSY_MESSAGE;
    return json;
}

Json::Value pong_json() {
    Json::Value json;
    json["type"] = "pong";
    return json;
}

Json::Value no_face_json() {
    Json::Value json;
    json["status"] = "no_face_detected";
    json["message"] = NO_FACE_MESSAGE;
    return json;
}

void add_punctuality(Json::Value& json, EventType type, const Punctuality& punctuality) {
    if (type == EventType::Entry) {
        json["is_late"] = punctuality.is_late;
        json["minutes_late"] = punctuality.minutes_late ? Json::Value(*punctuality.minutes_late)
                                                        : Json::Value(Json::nullValue);
        json["late_message"] = punctuality.is_late ? Json::Value(punctuality.late_message)
                                                   : Json::Value(Json::nullValue);
    } else {
        json["is_early_exit"] = punctuality.is_early_exit;
        json["early_exit_message"] = punctuality.is_early_exit ? Json::Value(punctuality.early_exit_message)
                                                               : Json::Value(Json::nullValue);
    }
}

Json::Value office_timings_json(const OfficeTimings& timings) {
    Json::Value json;
    json["login_time"] = timings.login_minute ? Json::Value(format_clock_time(*timings.login_minute))
                                              : Json::Value(Json::nullValue);
    json["logout_time"] = timings.logout_minute ? Json::Value(format_clock_time(*timings.logout_minute))
                                                : Json::Value(Json::nullValue);
    json["grace_minutes"] = timings.grace_minutes;
    return json;
}

Json::Value attendance_update_json(const AttendanceEvent& event,
                                   const std::string& display_name,
                                   const std::optional<Punctuality>& punctuality) {
    Json::Value data;
    data["action"] = to_string(event.event_type);
    data["user_id"] = event.identity_id;
    data["name"] = display_name;
    data["timestamp"] = format_timestamp(event.occurred_at);
    data["similarity"] = event.confidence;
    data["event_id"] = static_cast<Json::Int64>(event.event_id);
    if (punctuality) {
        add_punctuality(data, event.event_type, *punctuality);
    }

    Json::Value json;
    json["type"] = "attendance_update";
    json["data"] = data;
    return json;
}

Json::Value diagnostic_json(const DiagnosticResult& result) {
    Json::Value json;
    json["match_found"] = result.match_found;
    json["threshold"] = result.threshold;

    Json::Value best;
    if (result.best_match) {
        best["user_id"] = result.best_match->identity_id;
        best["name"] = result.best_match->display_name;
        best["similarity"] = result.best_match->similarity;
    } else {
        best["user_id"] = Json::nullValue;
        best["name"] = Json::nullValue;
        best["similarity"] = 0.0;
    }
    json["best_match"] = best;

    json["all_similarities"] = Json::arrayValue;
    for (const auto& row : result.all_similarities) {
        Json::Value item;
        item["user_id"] = row.identity_id;
        item["name"] = row.display_name;
        item["similarity"] = row.similarity;
        item["match"] = row.match;
        json["all_similarities"].append(item);
    }
    return json;
}

Json::Value identity_json(const Identity& identity) {
    Json::Value json;
    json["user_id"] = identity.identity_id;
    json["name"] = identity.display_name;
    json["created_at"] = format_timestamp(identity.registered_at);
    return json;
}

Json::Value event_json(const AttendanceEvent& event) {
    Json::Value json;
    json["id"] = static_cast<Json::Int64>(event.event_id);
    json["user_id"] = event.identity_id;
    json["entry_type"] = to_string(event.event_type);
    json["timestamp"] = format_timestamp(event.occurred_at);
    json["confidence"] = event.confidence;
    return json;
}

std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

}  // namespace wire
}  // namespace rollcall
