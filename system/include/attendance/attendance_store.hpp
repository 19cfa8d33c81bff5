// ============= include/attendance/attendance_store.hpp =============
#pragma once
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rollcall {

/*
 * Contrato de persistencia que consume el motor.
 *
 * Fallos de I/O -> PersistenceError.
 * "No encontrado" en operaciones administrativas -> false / nullopt.
 */
class AttendanceStore {
public:
    virtual ~AttendanceStore() = default;

    // Devuelve el event_id asignado (monotónico)
    virtual int64_t append_event(const AttendanceEvent& event) = 0;

    // Orden por occurred_at ascendente
    virtual std::vector<AttendanceEvent> list_events() = 0;

    virtual std::optional<AttendanceEvent> find_event(int64_t event_id) = 0;

    virtual bool delete_event(int64_t event_id) = 0;

    // Último occurred_at para (identity_id, event_type)
    virtual std::optional<TimePoint> latest_event_time(const std::string& identity_id,
                                                       EventType event_type) = 0;

    virtual void upsert_identity(const Identity& identity) = 0;
    virtual bool delete_identity(const std::string& identity_id) = 0;
    virtual std::vector<Identity> list_identities() = 0;
};

}  // namespace rollcall
