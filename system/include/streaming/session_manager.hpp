// ============= include/streaming/session_manager.hpp =============
#pragma once
#include "streaming/streaming_session.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rollcall {

/*
 * Registro de sesiones abiertas + broadcast de eventos aceptados
 * ({"type": "attendance_update", "data": {...}}).
 */
class SessionManager {
public:
    SessionManager(AttendancePipeline& pipeline, ThreadPool& session_pool, size_t max_pending);
    ~SessionManager();

    std::shared_ptr<StreamingSession> open_session(StreamingSession::Sender sender);
    void close_session(const std::string& session_id);

    std::shared_ptr<StreamingSession> find(const std::string& session_id) const;

    void broadcast(const AttendanceEvent& event,
                   const std::string& display_name,
                   const std::optional<Punctuality>& punctuality = std::nullopt);

    size_t active_count() const;
    void close_all();

private:
    AttendancePipeline& pipeline;
    ThreadPool& session_pool;
    size_t max_pending;

    mutable std::mutex sessions_mutex;
    std::unordered_map<std::string, std::shared_ptr<StreamingSession>> sessions;

    static std::string generate_id();
};

}  // namespace rollcall
