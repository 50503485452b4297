#pragma once

#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <string>

#include "config/ServerSettings.hpp"
#include "network/ConnectionGateway.hpp"
#include "network/WebSocketConnection.hpp"

// WebSocket endpoint on a single asio io_context. Feeds socket events into
// the ConnectionGateway and drives its periodic sweep.
class GameServer {
public:
    GameServer(const ServerSettings& settings, GameRules rules);
    ~GameServer();

    bool Initialize();
    void Run();
    void Shutdown();

private:
    void SetupSignalHandlers();
    void ScheduleSweep();

    void OnSocketInit(websocketpp::connection_hdl hdl, asio::ip::tcp::socket& socket);
    void OnOpen(websocketpp::connection_hdl hdl);
    void OnClose(websocketpp::connection_hdl hdl);
    void OnMessage(websocketpp::connection_hdl hdl, WsServer::message_ptr message);

    std::shared_ptr<WebSocketConnection> TakeConnection(websocketpp::connection_hdl hdl);

    ServerSettings settings_;

    asio::io_context ioContext_;
    asio::signal_set signals_;
    asio::steady_timer sweepTimer_;

    WsServer endpoint_;
    ConnectionGateway gateway_;

    std::map<websocketpp::connection_hdl, std::shared_ptr<WebSocketConnection>,
             std::owner_less<websocketpp::connection_hdl>> connections_;
    uint64_t nextConnectionId_ = 1;

    std::atomic<bool> running_{false};
};
