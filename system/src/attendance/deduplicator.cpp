// ============= src/attendance/deduplicator.cpp =============
#include "attendance/deduplicator.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace rollcall {

const char* to_string(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::Accepted:          return "accepted";
        case DecisionReason::AlreadyMarked:     return "already_marked";
        case DecisionReason::PersistenceFailed: return "persistence_failed";
    }
    return "unknown";
}

Deduplicator::Deduplicator(AttendanceStore& store, std::chrono::seconds cooldown)
    : store(store), cooldown_window(cooldown)
{
    if (cooldown.count() < 0) {
        throw std::invalid_argument("cooldown must be >= 0");
    }
}

std::string Deduplicator::make_key(const std::string& identity_id, EventType event_type) {
    return identity_id + '\x1f' + to_string(event_type);
}

std::shared_ptr<Deduplicator::KeyState> Deduplicator::state_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(map_mutex);
    auto& slot = states[key];
    if (!slot) slot = std::make_shared<KeyState>();
    return slot;
}

size_t Deduplicator::cached_keys() const {
    std::lock_guard<std::mutex> lock(map_mutex);
    return states.size();
}

void Deduplicator::warm_up() {
    auto events = store.list_events();

    size_t keys = 0;
    for (const auto& event : events) {
        auto state = state_for(make_key(event.identity_id, event.event_type));
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->last_accepted) keys++;
        if (!state->last_accepted || event.occurred_at > *state->last_accepted) {
            state->last_accepted = event.occurred_at;
        }
    }

    spdlog::info("✓ Deduplicator warm-up: {} events, {} keys (cooldown {}s)",
                 events.size(), keys, cooldown_window.count());
}

Decision Deduplicator::decide(const std::string& identity_id,
                              EventType event_type,
                              float similarity,
                              TimePoint now) {
    auto state = state_for(make_key(identity_id, event_type));

    // Decisión + append + cache atómicos para esta clave
    std::lock_guard<std::mutex> lock(state->mutex);

    Decision decision;

    if (state->last_accepted && (now - *state->last_accepted) <= cooldown_window) {
        decision.accept = false;
        decision.reason = DecisionReason::AlreadyMarked;
        decision.last_event_at = state->last_accepted;
        spdlog::debug("Dedup: {} {} already marked", identity_id, to_string(event_type));
        return decision;
    }

    AttendanceEvent event;
    event.identity_id = identity_id;
    event.event_type = event_type;
    event.occurred_at = now;
    event.confidence = std::clamp(similarity, 0.0f, 1.0f);

    try {
        decision.event_id = store.append_event(event);
    } catch (const PersistenceError& e) {
        spdlog::error("Dedup: append failed for {} {}: {}", identity_id, to_string(event_type), e.what());
        decision.accept = false;
        decision.reason = DecisionReason::PersistenceFailed;
        decision.last_event_at = state->last_accepted;
        return decision;
    }

    state->last_accepted = now;

    decision.accept = true;
    decision.reason = DecisionReason::Accepted;
    decision.last_event_at = now;

    spdlog::info("✓ {} marked for {} (event {}, sim={:.3f})",
                 to_string(event_type), identity_id, decision.event_id, similarity);
    return decision;
}

void Deduplicator::forget_event(const AttendanceEvent& event) {
    auto state = state_for(make_key(event.identity_id, event.event_type));

    std::lock_guard<std::mutex> lock(state->mutex);
    // El store guarda milisegundos: comparar con esa resolución
    if (!state->last_accepted ||
        to_epoch_ms(*state->last_accepted) != to_epoch_ms(event.occurred_at)) {
        return;
    }

    state->last_accepted = store.latest_event_time(event.identity_id, event.event_type);
    spdlog::debug("Dedup: key {} {} reloaded after event {} removal",
                  event.identity_id, to_string(event.event_type), event.event_id);
}

}  // namespace rollcall
