// ============= src/streaming/streaming_session.cpp =============
#include "streaming/streaming_session.hpp"
#include "streaming/wire_codec.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "CONNECTING";
        case SessionState::Open:       return "OPEN";
        case SessionState::Decoding:   return "DECODING";
        case SessionState::Matching:   return "MATCHING";
        case SessionState::Responding: return "RESPONDING";
        case SessionState::Closed:     return "CLOSED";
    }
    return "UNKNOWN";
}

StreamingSession::StreamingSession(std::string id,
                                   AttendancePipeline& pipeline,
                                   ThreadPool& pool,
                                   Sender sender,
                                   size_t max_pending)
    : session_id(std::move(id)), pipeline(pipeline), pool(pool),
      sender(std::move(sender)), max_pending(max_pending == 0 ? 1 : max_pending)
{
}

void StreamingSession::transition(SessionState next) {
    // CLOSED es terminal
    SessionState expected = current.load();
    while (expected != SessionState::Closed &&
           !current.compare_exchange_weak(expected, next)) {
    }
}

void StreamingSession::open() {
    transition(SessionState::Open);
    spdlog::info("🔌 Session {} open", session_id);
}

bool StreamingSession::close() {
    SessionState previous = current.exchange(SessionState::Closed);
    if (previous == SessionState::Closed) return false;

    size_t dropped;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex);
        dropped = inbox.size();
        inbox.clear();
    }

    spdlog::info("🔌 Session {} closed ({} frames processed, {} rejected, {} dropped)",
                 session_id, processed.load(), rejected.load(), dropped);
    return true;
}

void StreamingSession::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(send_mutex);
    if (is_closed()) return;

    try {
        sender(text);
    } catch (const std::exception& e) {
        spdlog::warn("Session {}: send failed: {}", session_id, e.what());
    }
}

void StreamingSession::on_message(std::string text) {
    if (state() == SessionState::Connecting) {
        spdlog::warn("Session {}: message before open, ignored", session_id);
        return;
    }

    bool schedule = false;
    bool full = false;
    {
        std::lock_guard<std::mutex> lock(inbox_mutex);
        if (is_closed()) return;

        // El frame en proceso cuenta como pendiente
        size_t pending = inbox.size() + (handling ? 1 : 0);
        if (pending >= max_pending) {
            full = true;
            rejected++;
        } else {
            inbox.push_back(std::move(text));
            if (!busy) {
                busy = true;
                schedule = true;
            }
        }
    }

    if (full) {
        spdlog::debug("Session {}: busy, frame dropped", session_id);
        send(wire::serialize(wire::busy_json()));
        return;
    }

    if (schedule) {
        auto self = shared_from_this();
        try {
            pool.post([self]() { self->pump(); });
        } catch (const std::exception& e) {
            spdlog::error("Session {}: cannot schedule frame: {}", session_id, e.what());
            std::lock_guard<std::mutex> lock(inbox_mutex);
            busy = false;
            handling = false;
            inbox.clear();
        }
    }
}

void StreamingSession::pump() {
    while (true) {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(inbox_mutex);
            handling = false;
            if (inbox.empty() || is_closed()) {
                busy = false;
                return;
            }
            text = std::move(inbox.front());
            inbox.pop_front();
            handling = true;
        }

        handle(text);
    }
}

void StreamingSession::handle(const std::string& text) {
    auto cancelled = [this]() { return is_closed(); };

    try {
        transition(SessionState::Decoding);
        wire::InboundMessage message = wire::parse_inbound(text);

        if (message.kind == wire::InboundKind::Ping) {
            send(wire::serialize(wire::pong_json()));
            transition(SessionState::Open);
            return;
        }

        auto queries = pipeline.extract_embeddings(message.image_bytes);
        if (cancelled()) return;

        transition(SessionState::Matching);
        FrameResponse response = pipeline.recognize(queries, message.event_type, Clock::now(), cancelled);
        if (cancelled()) return;

        transition(SessionState::Responding);
        send(wire::serialize(wire::response_json(response)));
        processed++;

    } catch (const NoFaceDetected&) {
        send(wire::serialize(wire::no_face_json()));
    } catch (const std::exception& e) {
        ErrorResponse error = to_error_response(e);
        spdlog::debug("Session {}: frame error: {}", session_id, error.message);
        send(wire::serialize(wire::error_json(error.message)));
    }

    transition(SessionState::Open);
}

}  // namespace rollcall
