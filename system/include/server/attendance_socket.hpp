// ============= include/server/attendance_socket.hpp =============
#pragma once
#include "streaming/session_manager.hpp"
#include <drogon/WebSocketController.h>

namespace rollcall {

// GET /ws/attendance -> una StreamingSession por conexión
class AttendanceSocket : public drogon::WebSocketController<AttendanceSocket, false> {
public:
    explicit AttendanceSocket(SessionManager& manager) : manager(manager) {}

    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws/attendance");
    WS_PATH_LIST_END

private:
    SessionManager& manager;
};

}  // namespace rollcall
