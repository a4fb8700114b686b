#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "ChatTransport.hpp"
#include "TriviaTypes.hpp"

using json = nlohmann::json;

// TCP group chat. Every joined client sees every message; the trivia bot
// speaks through the ChatTransport interface.
class ChatServer : public ChatTransport {
public:
    using MessageHandler = std::function<void(const MessageEvent&)>;
    using ControlHandler = std::function<void(const std::string& signal)>;

private:
    int m_port;
    std::atomic<int> m_server_fd; // shut down by stop(), closed only once run() is done
    std::atomic<bool> m_running;
    std::string m_bot_name;
    std::string m_operator_name;
    std::atomic<uint64_t> m_next_message_id;

    // socket <-> name of joined clients
    std::map<int, std::string> m_socket_to_user;
    std::map<std::string, int> m_user_to_socket;
    std::set<int> m_client_sockets; // every connected socket, joined or not
    std::mutex m_session_mutex;
    std::mutex m_send_mutex;        // one frame at a time per socket
    std::atomic<int> m_active_clients;

    MessageHandler m_message_handler;
    ControlHandler m_control_handler;

    void handleClient(int client_socket);
    void handleJoin(int client_socket, const json& payload);
    void handleChat(int client_socket, const json& payload);
    void handleControl(int client_socket, const json& payload);

    std::string nextMessageId();
    void broadcast(const json& msg, int exclude_socket = -1);
    void closeListener();

public:
    ChatServer(int port, const std::string& bot_name, const std::string& operator_name);
    ~ChatServer() override;

    // Must be set before start(); called on client threads.
    void setMessageHandler(MessageHandler handler) { m_message_handler = std::move(handler); }
    void setControlHandler(ControlHandler handler) { m_control_handler = std::move(handler); }

    bool start();
    void run();   // accept loop, returns after stop()
    void stop();
    int getPort() const { return m_port; } // the bound port, also when constructed with 0

    // --- ChatTransport ---
    void send(const std::string& text) override;
    void reply(const std::string& text, const std::string& quoted_message_id) override;
    double serverTime() override;

    void broadcastLeaderboard(const json& table);
    void sendMessageToSocket(int client_sock, const json& msg);

    std::string getUserForSocket(int client_sock);
    bool registerSession(int client_sock, const std::string& username);
    void removeSession(int client_sock);
};
