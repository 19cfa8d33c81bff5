#include "core/types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rollcall {

const char* to_string(EventType type) {
    return type == EventType::Exit ? "exit" : "entry";
}

EventType parse_event_type(const std::string& text) {
    if (text == "entry") return EventType::Entry;
    if (text == "exit") return EventType::Exit;
    throw std::invalid_argument("entry_type must be 'entry' or 'exit', got '" + text + "'");
}

int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

std::string format_timestamp(TimePoint tp) {
    auto time_t_val = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds(1000);

    std::tm local{};
    localtime_r(&time_t_val, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

}  // namespace rollcall
