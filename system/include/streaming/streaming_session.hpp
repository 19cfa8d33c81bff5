// ============= include/streaming/streaming_session.hpp =============
/*
 * Streaming Session - una por conexión
 *
 *   CONNECTING ─► OPEN ─► (DECODING ─► MATCHING ─► RESPONDING) ─► OPEN ─► CLOSED
 *
 * - Los mensajes entran en un inbox y se procesan en orden, uno a la vez,
 *   en el pool de sesiones (nunca en el thread de I/O)
 * - Inbox lleno (max_pending) -> respuesta inmediata "busy" y el frame se descarta
 * - Un error en un frame responde {error} y la sesión sigue OPEN
 * - close(): los puntos de suspensión (provider, append) comprueban el
 *   estado; tras cerrar no se envía nada más
 */

#pragma once
#include "concurrency/thread_pool.hpp"
#include "pipeline/attendance_pipeline.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace rollcall {

enum class SessionState {
    Connecting,
    Open,
    Decoding,
    Matching,
    Responding,
    Closed
};

const char* to_string(SessionState state);

class StreamingSession : public std::enable_shared_from_this<StreamingSession> {
public:
    using Sender = std::function<void(const std::string&)>;

    StreamingSession(std::string id,
                     AttendancePipeline& pipeline,
                     ThreadPool& pool,
                     Sender sender,
                     size_t max_pending);

    void open();
    void on_message(std::string text);

    // true si esta llamada cerró la sesión
    bool close();

    // Envío directo (broadcast). No-op si la sesión está cerrada
    void send(const std::string& text);

    SessionState state() const { return current.load(); }
    bool is_closed() const { return current.load() == SessionState::Closed; }
    const std::string& id() const { return session_id; }

    size_t frames_processed() const { return processed.load(); }
    size_t frames_rejected() const { return rejected.load(); }

private:
    std::string session_id;
    AttendancePipeline& pipeline;
    ThreadPool& pool;
    Sender sender;
    size_t max_pending;

    std::atomic<SessionState> current{SessionState::Connecting};
    std::atomic<size_t> processed{0};
    std::atomic<size_t> rejected{0};

    std::mutex inbox_mutex;
    std::deque<std::string> inbox;
    bool busy = false;      // hay un pump en curso
    bool handling = false;  // frame fuera del inbox, en proceso

    std::mutex send_mutex;

    void pump();
    void handle(const std::string& text);
    void transition(SessionState next);
};

}  // namespace rollcall
