// ============= include/attendance/deduplicator.hpp =============
/*
 * Attendance Deduplicator
 *
 * POLÍTICA:
 * - Cache en memoria: (identity_id, event_type) -> último evento aceptado
 * - Sin evento previo, o now - last > cooldown  -> append + cache + accept
 * - Si no                                       -> already_marked
 * - Decisión + append + cache bajo el lock de la clave (no hay lock global)
 * - Append fallido -> persistence_failed, cache intacto
 *
 * entry y exit son claves independientes.
 */

#pragma once
#include "attendance/attendance_store.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rollcall {

enum class DecisionReason {
    Accepted,
    AlreadyMarked,
    PersistenceFailed
};

const char* to_string(DecisionReason reason);

struct Decision {
    bool accept = false;
    DecisionReason reason = DecisionReason::AlreadyMarked;
    std::optional<TimePoint> last_event_at;   // previo (rechazo) o el nuevo (aceptado)
    int64_t event_id = 0;                     // solo si accept
};

class Deduplicator {
public:
    Deduplicator(AttendanceStore& store, std::chrono::seconds cooldown);

    // Carga el último evento por clave desde el historial persistido
    void warm_up();

    Decision decide(const std::string& identity_id,
                    EventType event_type,
                    float similarity,
                    TimePoint now);

    // Tras borrar un evento administrativamente: si era el cacheado,
    // la clave se recarga desde el store
    void forget_event(const AttendanceEvent& event);

    std::chrono::seconds cooldown() const { return cooldown_window; }
    size_t cached_keys() const;

private:
    struct KeyState {
        std::mutex mutex;
        std::optional<TimePoint> last_accepted;
    };

    AttendanceStore& store;
    std::chrono::seconds cooldown_window;

    mutable std::mutex map_mutex;   // solo protege el mapa, nunca I/O
    std::unordered_map<std::string, std::shared_ptr<KeyState>> states;

    static std::string make_key(const std::string& identity_id, EventType event_type);
    std::shared_ptr<KeyState> state_for(const std::string& key);
};

}  // namespace rollcall
