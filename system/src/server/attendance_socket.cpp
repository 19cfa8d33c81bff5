// ============= src/server/attendance_socket.cpp =============
#include "server/attendance_socket.hpp"
#include <spdlog/spdlog.h>

namespace rollcall {

void AttendanceSocket::handleNewConnection(const drogon::HttpRequestPtr& req,
                                           const drogon::WebSocketConnectionPtr& conn) {
    // El sender no mantiene viva la conexión
    std::weak_ptr<drogon::WebSocketConnection> weak = conn;
    auto session = manager.open_session([weak](const std::string& text) {
        auto c = weak.lock();
        if (c && c->connected()) {
            c->send(text);
        }
    });

    conn->setContext(session);
    spdlog::debug("WebSocket {} from {}", session->id(), req->peerAddr().toIpPort());
}

void AttendanceSocket::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                        std::string&& message,
                                        const drogon::WebSocketMessageType& type) {
    if (type != drogon::WebSocketMessageType::Text &&
        type != drogon::WebSocketMessageType::Binary) {
        return;
    }

    auto session = conn->getContext<StreamingSession>();
    if (!session) {
        spdlog::warn("WebSocket message without session");
        return;
    }
    session->on_message(std::move(message));
}

void AttendanceSocket::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) {
    auto session = conn->getContext<StreamingSession>();
    if (!session) return;

    manager.close_session(session->id());
    conn->clearContext();
}

}  // namespace rollcall
