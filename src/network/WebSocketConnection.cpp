#include "network/WebSocketConnection.hpp"
#include "logging/Logger.hpp"
#include <chrono>

WebSocketConnection::WebSocketConnection(uint64_t connectionId, WsServer& server,
                                         websocketpp::connection_hdl hdl,
                                         const ServerSettings& settings)
    : ClientConnection(connectionId, settings.outboundQueueSize, settings.outboundHardLimit),
      server_(server),
      hdl_(std::move(hdl)),
      remoteAddress_("unknown"),
      flushTimer_(server.get_io_service()) {

    std::error_code ec;
    auto con = server_.get_con_from_hdl(hdl_, ec);
    if (!ec && con) {
        remoteAddress_ = con->get_remote_endpoint();
    }
}

WebSocketConnection::~WebSocketConnection() {
    Logger::Debug("WebSocketConnection {} destroyed", GetId());
}

void WebSocketConnection::Flush() {
    std::error_code ec;
    auto con = server_.get_con_from_hdl(hdl_, ec);
    if (ec || !con || con->get_state() != websocketpp::session::state::open) {
        return;
    }

    while (con->get_buffered_amount() < MAX_BUFFERED_BYTES) {
        auto text = queue_.Pop();
        if (!text) {
            return;
        }
        server_.send(hdl_, *text, websocketpp::frame::opcode::text, ec);
        if (ec) {
            Logger::Warn("Send to connection {} failed: {}", GetId(), ec.message());
            return;
        }
    }

    // Socket is backed up; try again shortly.
    ScheduleFlush();
}

void WebSocketConnection::ScheduleFlush() {
    if (flushPending_) {
        return;
    }
    flushPending_ = true;

    auto self = std::static_pointer_cast<WebSocketConnection>(shared_from_this());
    flushTimer_.expires_after(std::chrono::milliseconds(20));
    flushTimer_.async_wait([self](const std::error_code& ec) {
        self->flushPending_ = false;
        if (!ec && self->IsOpen()) {
            self->Flush();
        }
    });
}

void WebSocketConnection::Close(const std::string& reason) {
    if (!open_.exchange(false)) {
        return;
    }

    // Push out whatever the socket will take before the close frame.
    Flush();
    flushTimer_.cancel();

    std::error_code ec;
    server_.close(hdl_, websocketpp::close::status::going_away, reason, ec);
    if (ec) {
        Logger::Debug("Close of connection {} failed: {}", GetId(), ec.message());
    }
    Logger::Debug("Closing connection {}: {}", GetId(), reason);
}
