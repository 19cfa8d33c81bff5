// ============= include/attendance/office_policy.hpp =============
/*
 * Horario de oficina (hora local)
 *
 *   entry después de login + grace  -> is_late, minutes_late (desde login)
 *   exit antes de logout            -> is_early_exit
 *
 * Sin login/logout configurado no se clasifica ese tipo de evento.
 * Solo se aplica a eventos aceptados; no afecta al cooldown.
 */

#pragma once
#include "core/types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace rollcall {

struct OfficeTimings {
    std::optional<int> login_minute;    // minutos desde medianoche
    std::optional<int> logout_minute;
    int grace_minutes = 60;
};

struct Punctuality {
    bool is_late = false;
    std::optional<int> minutes_late;
    std::string late_message;

    bool is_early_exit = false;
    std::string early_exit_message;

    bool flagged() const { return is_late || is_early_exit; }
};

// "HH:MM" -> minutos desde medianoche. std::invalid_argument si no es válido
int parse_clock_time(const std::string& text);
std::string format_clock_time(int minute_of_day);

// "" -> nullopt
std::optional<int> parse_optional_clock_time(const std::string& text);

class OfficePolicy {
public:
    explicit OfficePolicy(OfficeTimings timings = {});

    // nullopt si no hay horario para ese tipo de evento
    std::optional<Punctuality> classify(EventType type, TimePoint at) const;

    OfficeTimings timings() const;
    void set_timings(const OfficeTimings& timings);

    bool enabled() const;

private:
    mutable std::mutex mutex;
    OfficeTimings current;

    static void validate(const OfficeTimings& timings);
};

}  // namespace rollcall
