// ============= include/core/types.hpp =============
/*
 * Tipos compartidos del motor de asistencia
 *
 * Identity         -> persona registrada (1 embedding por persona)
 * AttendanceEvent  -> registro append-only de entrada/salida
 *
 * Los timestamps viajan como system_clock::time_point dentro del motor
 * y como epoch en milisegundos en SQLite.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rollcall {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class EventType {
    Entry,
    Exit
};

struct Identity {
    std::string identity_id;
    std::string display_name;
    std::vector<float> embedding;
    TimePoint registered_at;
};

struct AttendanceEvent {
    int64_t event_id = 0;
    std::string identity_id;
    EventType event_type = EventType::Entry;
    TimePoint occurred_at;
    float confidence = 0.0f;
};

const char* to_string(EventType type);

// Accepts "entry" / "exit"; throws std::invalid_argument otherwise
EventType parse_event_type(const std::string& text);

int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(int64_t ms);

// "2025-11-24T14:30:52.123" in local time
std::string format_timestamp(TimePoint tp);

}  // namespace rollcall
