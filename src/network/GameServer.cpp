#include "network/GameServer.hpp"
#include "logging/Logger.hpp"
#include <functional>

GameServer::GameServer(const ServerSettings& settings, GameRules rules)
    : settings_(settings),
      signals_(ioContext_),
      sweepTimer_(ioContext_),
      gateway_(settings, std::move(rules)) {
}

GameServer::~GameServer() {
    Shutdown();
}

bool GameServer::Initialize() {
    using websocketpp::lib::placeholders::_1;
    using websocketpp::lib::placeholders::_2;

    try {
        endpoint_.clear_access_channels(websocketpp::log::alevel::all);
        endpoint_.clear_error_channels(websocketpp::log::elevel::all);
        endpoint_.set_error_channels(websocketpp::log::elevel::rerror | websocketpp::log::elevel::fatal);

        endpoint_.init_asio(&ioContext_);
        endpoint_.set_reuse_addr(true);
        endpoint_.set_max_message_size(settings_.maxMessageSize);

        endpoint_.set_socket_init_handler(std::bind(&GameServer::OnSocketInit, this, _1, _2));
        endpoint_.set_open_handler(std::bind(&GameServer::OnOpen, this, _1));
        endpoint_.set_close_handler(std::bind(&GameServer::OnClose, this, _1));
        endpoint_.set_fail_handler(std::bind(&GameServer::OnClose, this, _1));
        endpoint_.set_message_handler(std::bind(&GameServer::OnMessage, this, _1, _2));

        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(settings_.host), settings_.port);
        endpoint_.listen(endpoint);

        SetupSignalHandlers();

        Logger::Info("GameServer initialized on {}:{}", settings_.host, settings_.port);
        return true;

    } catch (const websocketpp::exception& e) {
        Logger::Critical("Failed to initialize server: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        Logger::Critical("Failed to initialize server: {}", e.what());
        return false;
    }
}

void GameServer::Run() {
    running_ = true;

    endpoint_.start_accept();
    ScheduleSweep();

    Logger::Info("GameServer listening for WebSocket connections");

    ioContext_.run();

    Logger::Info("GameServer event loop stopped");
}

void GameServer::SetupSignalHandlers() {
    signals_.add(SIGINT);
    signals_.add(SIGTERM);

    signals_.async_wait([this](std::error_code ec, int signal) {
        if (!ec) {
            Logger::Info("Received signal {}, shutting down...", signal);
            Shutdown();
        }
    });
}

void GameServer::ScheduleSweep() {
    sweepTimer_.expires_after(settings_.sweepInterval);
    sweepTimer_.async_wait([this](const std::error_code& ec) {
        if (ec || !running_) {
            return;
        }
        try {
            gateway_.Sweep();
        } catch (const std::exception& e) {
            Logger::Error("Sweep failed: {}", e.what());
        }
        ScheduleSweep();
    });
}

void GameServer::Shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    std::error_code ec;
    endpoint_.stop_listening(ec);
    if (ec) {
        Logger::Warn("stop_listening failed: {}", ec.message());
    }

    gateway_.Shutdown("server shutting down");

    signals_.cancel();
    sweepTimer_.cancel();

    // Let close frames go out, then stop the loop.
    sweepTimer_.expires_after(std::chrono::seconds(2));
    sweepTimer_.async_wait([this](const std::error_code&) {
        ioContext_.stop();
    });

    Logger::Info("GameServer shutdown initiated");
}

// =============== Endpoint Callbacks ===============

void GameServer::OnSocketInit(websocketpp::connection_hdl, asio::ip::tcp::socket& socket) {
    std::error_code ec;
    socket.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        Logger::Warn("Failed to set TCP_NODELAY: {}", ec.message());
    }
}

void GameServer::OnOpen(websocketpp::connection_hdl hdl) {
    auto connection = std::make_shared<WebSocketConnection>(nextConnectionId_++, endpoint_, hdl, settings_);
    connections_[hdl] = connection;

    if (!gateway_.OnOpen(connection)) {
        connections_.erase(hdl);
    }
}

void GameServer::OnClose(websocketpp::connection_hdl hdl) {
    auto connection = TakeConnection(hdl);
    if (connection) {
        gateway_.OnClose(connection);
    }
}

void GameServer::OnMessage(websocketpp::connection_hdl hdl, WsServer::message_ptr message) {
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
        Logger::Debug("Message for an unknown connection dropped");
        return;
    }

    if (message->get_opcode() != websocketpp::frame::opcode::text) {
        it->second->Send(Message::Error(ErrorCode::MALFORMED_FRAME, "Only text frames are accepted"));
        return;
    }

    gateway_.OnText(it->second, message->get_payload());
}

std::shared_ptr<WebSocketConnection> GameServer::TakeConnection(websocketpp::connection_hdl hdl) {
    auto it = connections_.find(hdl);
    if (it == connections_.end()) {
        return nullptr;
    }
    auto connection = it->second;
    connections_.erase(it);
    return connection;
}
