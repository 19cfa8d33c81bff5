// ============= test/test_office_policy.cpp =============
#include "attendance/office_policy.hpp"
#include "pipeline/attendance_pipeline.hpp"
#include "pipeline/identity_registry.hpp"
#include "test_support.hpp"
#include <ctime>
#include <stdexcept>

using namespace rollcall;
using namespace std::chrono_literals;
using test::check;

static const std::vector<float> ALICE = {1, 0, 0, 0};

// Hora local de un día fijo
static TimePoint local_time(int hour, int minute, int second = 0) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 12;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

static OfficeTimings nine_to_six() {
    OfficeTimings timings;
    timings.login_minute = 9 * 60;
    timings.logout_minute = 18 * 60;
    timings.grace_minutes = 60;
    return timings;
}

void test_clock_parsing() {
    test::section("clock parsing");
    check(parse_clock_time("09:00") == 540, "09:00 -> 540");
    check(parse_clock_time("23:59") == 1439, "23:59 -> 1439");
    check(format_clock_time(545) == "09:05", "545 -> 09:05");
    check(format_clock_time(1440 + 60) == "01:00", "format wraps past midnight");
    check(!parse_optional_clock_time("").has_value(), "empty -> no time");

    auto rejects = [](const std::string& text) {
        try {
            parse_clock_time(text);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    check(rejects("25:00"), "hour out of range rejected");
    check(rejects("09:60"), "minute out of range rejected");
    check(rejects("9"), "missing minutes rejected");
    check(rejects("09:00x"), "trailing text rejected");

    bool grace = false;
    OfficeTimings bad;
    bad.grace_minutes = -5;
    try { OfficePolicy policy(bad); } catch (const std::invalid_argument&) { grace = true; }
    check(grace, "negative grace rejected");
}

void test_entry_classification() {
    test::section("late arrival");
    OfficePolicy policy(nine_to_six());

    auto early = policy.classify(EventType::Entry, local_time(9, 30));
    check(early && !early->is_late && !early->minutes_late, "09:30 inside grace -> on time");

    auto edge = policy.classify(EventType::Entry, local_time(10, 0));
    check(edge && !edge->is_late, "exactly at grace end -> on time");

    auto just_late = policy.classify(EventType::Entry, local_time(10, 0, 1));
    check(just_late && just_late->is_late && just_late->minutes_late == 60, "one second past grace -> late, 60 min");

    auto late = policy.classify(EventType::Entry, local_time(10, 15));
    check(late && late->is_late && late->minutes_late == 75, "10:15 -> 75 minutes late");
    check(late && late->late_message ==
          "Late arrival: 10:15 (75 minutes late, Office time: 09:00, Grace period: 10:00)", "late message");
    check(late && !late->is_early_exit, "entry never flags early exit");
}

void test_exit_classification() {
    test::section("early exit");
    OfficePolicy policy(nine_to_six());

    auto early = policy.classify(EventType::Exit, local_time(17, 30));
    check(early && early->is_early_exit, "17:30 -> early exit");
    check(early && early->early_exit_message == "Early exit: 17:30 (Office time: 18:00)", "early exit message");

    auto on_time = policy.classify(EventType::Exit, local_time(18, 0));
    check(on_time && !on_time->is_early_exit, "18:00 -> not early");

    OfficeTimings login_only;
    login_only.login_minute = 9 * 60;
    OfficePolicy partial(login_only);
    check(!partial.classify(EventType::Exit, local_time(12, 0)).has_value(), "no logout time -> exit not classified");
    check(partial.enabled(), "login only still enabled");

    OfficePolicy none;
    check(!none.enabled() && !none.classify(EventType::Entry, local_time(12, 0)), "no timings -> disabled");

    none.set_timings(nine_to_six());
    check(none.enabled() && none.classify(EventType::Entry, local_time(11, 0))->is_late, "timings updated at runtime");
}

void test_pipeline_integration() {
    test::section("pipeline");
    test::MemoryStore store;
    EmbeddingGallery gallery(4);
    Deduplicator dedup(store, std::chrono::seconds(300));
    test::ScriptedProvider provider(4);
    FrameProcessor processor;
    OfficePolicy office(nine_to_six());
    AttendancePipeline pipeline(gallery, processor, dedup, provider, 0.6f, &office);
    IdentityRegistry registry(gallery, store, dedup, provider);
    registry.register_embedding("U1", "Alice", ALICE);

    std::vector<std::optional<Punctuality>> notices;
    pipeline.set_event_listener([&](const AttendanceEvent&, const std::string&,
                                    const std::optional<Punctuality>& punctuality) {
        notices.push_back(punctuality);
    });

    auto entry = pipeline.recognize({ALICE}, EventType::Entry, local_time(10, 30));
    auto* single = std::get_if<SingleResponse>(&entry);
    check(single && single->face.outcome == FaceOutcome::Accepted, "late entry still accepted");
    check(single && single->face.punctuality && single->face.punctuality->is_late &&
          single->face.punctuality->minutes_late == 90, "accepted entry carries late flag");

    auto again = pipeline.recognize({ALICE}, EventType::Entry, local_time(10, 31));
    single = std::get_if<SingleResponse>(&again);
    check(single && single->face.outcome == FaceOutcome::AlreadyMarked && !single->face.punctuality,
          "already marked -> no punctuality");

    auto exit = pipeline.recognize({ALICE}, EventType::Exit, local_time(16, 0));
    single = std::get_if<SingleResponse>(&exit);
    check(single && single->face.punctuality && single->face.punctuality->is_early_exit,
          "early exit flagged, independent of entry cooldown");

    check(notices.size() == 2 && notices[0] && notices[0]->is_late && notices[1] && notices[1]->is_early_exit,
          "listener receives punctuality");

    AttendancePipeline plain(gallery, processor, dedup, provider, 0.6f);
    auto other = plain.recognize({ALICE}, EventType::Entry, local_time(10, 30) + 1h);
    single = std::get_if<SingleResponse>(&other);
    check(single && single->face.outcome == FaceOutcome::Accepted && !single->face.punctuality,
          "no policy -> no punctuality");
}

int main() {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::set_level(spdlog::level::info);
    spdlog::info("🧪 Office Policy");

    test_clock_parsing();
    test_entry_classification();
    test_exit_classification();
    test_pipeline_integration();

    return test::finish("test_office_policy");
}
