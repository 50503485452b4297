#pragma once

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>
#include <asio.hpp>
#include <string>

#include "config/ServerSettings.hpp"
#include "network/ClientConnection.hpp"

using WsServer = websocketpp::server<websocketpp::config::asio>;

// websocketpp transport. Writes are paced by the socket's buffered amount so
// a slow reader backs up in the OutboundQueue, where the drop policy applies.
class WebSocketConnection : public ClientConnection {
public:
    static constexpr size_t MAX_BUFFERED_BYTES = 256 * 1024;

    WebSocketConnection(uint64_t connectionId, WsServer& server, websocketpp::connection_hdl hdl,
                        const ServerSettings& settings);
    ~WebSocketConnection() override;

    void Close(const std::string& reason) override;
    std::string GetRemoteAddress() const override { return remoteAddress_; }

protected:
    void Flush() override;

private:
    void ScheduleFlush();

    WsServer& server_;
    websocketpp::connection_hdl hdl_;
    std::string remoteAddress_;

    asio::steady_timer flushTimer_;
    bool flushPending_ = false;
};
