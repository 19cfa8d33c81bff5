// ============= src/attendance/office_policy.cpp =============
#include "attendance/office_policy.hpp"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace rollcall {

namespace {

constexpr int MINUTES_PER_DAY = 24 * 60;

// Segundos desde medianoche local
int local_second_of_day(TimePoint at) {
    std::time_t t = Clock::to_time_t(at);
    std::tm local{};
    localtime_r(&t, &local);
    return local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec;
}

}  // namespace

int parse_clock_time(const std::string& text) {
    int hours = -1, minutes = -1;
    char extra = 0;
    if (std::sscanf(text.c_str(), "%d:%d%c", &hours, &minutes, &extra) != 2 ||
        hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        throw std::invalid_argument("Invalid time '" + text + "', expected HH:MM");
    }
    return hours * 60 + minutes;
}

std::string format_clock_time(int minute_of_day) {
    int m = ((minute_of_day % MINUTES_PER_DAY) + MINUTES_PER_DAY) % MINUTES_PER_DAY;
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", m / 60, m % 60);
    return buf;
}

std::optional<int> parse_optional_clock_time(const std::string& text) {
    if (text.empty()) return std::nullopt;
    return parse_clock_time(text);
}

OfficePolicy::OfficePolicy(OfficeTimings timings) : current(timings) {
    validate(current);
}

void OfficePolicy::validate(const OfficeTimings& timings) {
    if (timings.grace_minutes < 0) {
        throw std::invalid_argument("grace period must be >= 0 minutes");
    }
    for (const auto& minute : {timings.login_minute, timings.logout_minute}) {
        if (minute && (*minute < 0 || *minute >= MINUTES_PER_DAY)) {
            throw std::invalid_argument("office time out of range");
        }
    }
}

OfficeTimings OfficePolicy::timings() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

void OfficePolicy::set_timings(const OfficeTimings& timings) {
    validate(timings);
    std::lock_guard<std::mutex> lock(mutex);
    current = timings;
    spdlog::info("🕘 Office timings: login {} | logout {} | grace {}min",
                 current.login_minute ? format_clock_time(*current.login_minute) : "-",
                 current.logout_minute ? format_clock_time(*current.logout_minute) : "-",
                 current.grace_minutes);
}

bool OfficePolicy::enabled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current.login_minute.has_value() || current.logout_minute.has_value();
}

std::optional<Punctuality> OfficePolicy::classify(EventType type, TimePoint at) const {
    OfficeTimings t = timings();
    int now_sec = local_second_of_day(at);
    std::string now_text = format_clock_time(now_sec / 60);

    Punctuality result;

    if (type == EventType::Entry) {
        if (!t.login_minute) return std::nullopt;

        int grace_end = *t.login_minute + t.grace_minutes;
        if (now_sec > grace_end * 60) {
            result.is_late = true;
            result.minutes_late = (now_sec - *t.login_minute * 60) / 60;
            result.late_message = "Late arrival: " + now_text + " (" +
                std::to_string(*result.minutes_late) + " minutes late, Office time: " +
                format_clock_time(*t.login_minute) + ", Grace period: " +
                format_clock_time(grace_end) + ")";
        }
        return result;
    }

    if (!t.logout_minute) return std::nullopt;

    if (now_sec < *t.logout_minute * 60) {
        result.is_early_exit = true;
        result.early_exit_message = "Early exit: " + now_text +
            " (Office time: " + format_clock_time(*t.logout_minute) + ")";
    }
    return result;
}

}  // namespace rollcall
