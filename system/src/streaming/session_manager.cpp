// ============= src/streaming/session_manager.cpp =============
#include "streaming/session_manager.hpp"
#include "streaming/wire_codec.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace rollcall {

SessionManager::SessionManager(AttendancePipeline& pipeline, ThreadPool& session_pool, size_t max_pending)
    : pipeline(pipeline), session_pool(session_pool), max_pending(max_pending)
{
    this->pipeline.set_event_listener([this](const AttendanceEvent& event,
                                             const std::string& name,
                                             const std::optional<Punctuality>& punctuality) {
        broadcast(event, name, punctuality);
    });
}

SessionManager::~SessionManager() {
    pipeline.set_event_listener({});
    close_all();
}

std::string SessionManager::generate_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
    return oss.str();
}

std::shared_ptr<StreamingSession> SessionManager::open_session(StreamingSession::Sender sender) {
    auto session = std::make_shared<StreamingSession>(generate_id(), pipeline, session_pool,
                                                      std::move(sender), max_pending);
    size_t total;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        sessions[session->id()] = session;
        total = sessions.size();
    }

    session->open();
    spdlog::info("New connection {}. Total connections: {}", session->id(), total);
    return session;
}

void SessionManager::close_session(const std::string& session_id) {
    std::shared_ptr<StreamingSession> session;
    size_t total;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) return;
        session = it->second;
        sessions.erase(it);
        total = sessions.size();
    }

    session->close();
    spdlog::info("Connection {} removed. Total connections: {}", session_id, total);
}

std::shared_ptr<StreamingSession> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex);
    auto it = sessions.find(session_id);
    return it == sessions.end() ? nullptr : it->second;
}

void SessionManager::broadcast(const AttendanceEvent& event,
                               const std::string& display_name,
                               const std::optional<Punctuality>& punctuality) {
    std::vector<std::shared_ptr<StreamingSession>> targets;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        targets.reserve(sessions.size());
        for (const auto& [id, session] : sessions) targets.push_back(session);
    }
    if (targets.empty()) return;

    std::string payload = wire::serialize(wire::attendance_update_json(event, display_name, punctuality));
    spdlog::info("📣 Broadcasting {} for {} to {} clients",
                 to_string(event.event_type), event.identity_id, targets.size());

    for (auto& session : targets) {
        session->send(payload);
    }
}

size_t SessionManager::active_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex);
    return sessions.size();
}

void SessionManager::close_all() {
    std::unordered_map<std::string, std::shared_ptr<StreamingSession>> closing;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        closing.swap(sessions);
    }
    for (auto& [id, session] : closing) {
        session->close();
    }
    if (!closing.empty()) {
        spdlog::info("Closed {} sessions", closing.size());
    }
}

}  // namespace rollcall
