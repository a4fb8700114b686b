#include "server.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

ChatServer::ChatServer(int port, const std::string& bot_name, const std::string& operator_name)
    : m_port(port),
      m_server_fd(-1),
      m_running(false),
      m_bot_name(bot_name),
      m_operator_name(operator_name),
      m_next_message_id(1),
      m_active_clients(0)
{}

ChatServer::~ChatServer() {
    stop();
    closeListener();
}

void ChatServer::closeListener() {
    int fd = m_server_fd.exchange(-1);
    if (fd != -1) {
        close(fd);
    }
}

/**
 * @brief Binds and listens. Port 0 picks a free port, readable with getPort().
 */
bool ChatServer::start() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        perror("socket failed");
        return false;
    }
    m_server_fd = fd;

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
        perror("setsockopt");
        closeListener();
        return false;
    }
    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(m_port);
    if (bind(fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
        perror("bind failed");
        closeListener();
        return false;
    }
    if (listen(fd, 10) < 0) {
        perror("listen");
        closeListener();
        return false;
    }
    socklen_t addrlen = sizeof(address);
    if (getsockname(fd, (struct sockaddr *)&address, &addrlen) == 0) {
        m_port = ntohs(address.sin_port);
    }
    m_running = true;
    std::cout << "Server listening on port " << m_port << std::endl;
    return true;
}

/**
 * @brief Accept loop. One detached thread per client; returns once stop() shuts the listener down.
 */
void ChatServer::run() {
    const int server_fd = m_server_fd.load();
    if (server_fd < 0) return;

    while (m_running) {
        sockaddr_in client_address;
        socklen_t addrlen = sizeof(client_address);
        int client_socket = accept(server_fd, (struct sockaddr *)&client_address, &addrlen);
        if (client_socket < 0) {
            if (!m_running) break;
            perror("accept");
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_session_mutex);
            m_client_sockets.insert(client_socket);
        }
        ++m_active_clients;
        std::cout << "New client connected (socket fd: " << client_socket << ")." << std::endl;

        std::thread clientThread([this, client_socket]() {
            try {
                handleClient(client_socket);
            } catch (const std::exception& e) {
                std::cerr << "Exception in client thread (socket " << client_socket << "): " << e.what() << std::endl;
            }

            std::cout << "Client " << client_socket << " disconnected." << std::endl;
            removeSession(client_socket);
            {
                std::lock_guard<std::mutex> lock(m_session_mutex);
                m_client_sockets.erase(client_socket);
            }
            close(client_socket);
            --m_active_clients;
        });
        clientThread.detach();
    }
}

/**
 * @brief Unblocks run() and every client thread. The listening socket is only
 * shut down here; it is closed by the destructor, after run() has returned.
 */
void ChatServer::stop() {
    bool was_running = m_running.exchange(false);
    int fd = m_server_fd.load();
    if (fd != -1) {
        shutdown(fd, SHUT_RDWR); // accept() fails with EINVAL
    }
    if (!was_running) return;

    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        for (int sock : m_client_sockets) {
            shutdown(sock, SHUT_RDWR); // unblocks recv in the client thread
        }
    }
    // Client threads are detached; give them a moment to let go of `this`
    for (int i = 0; i < 200 && m_active_clients > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::cout << "Server stopped." << std::endl;
}

// ==========================================================
// CLIENT DISPATCH
// ==========================================================

void ChatServer::handleClient(int client_socket) {
    while (m_running) {
        json msg = protocol::receiveMessage(client_socket);
        if (msg.empty()) break;

        std::string action;
        json payload;
        try {
            action = msg.at("action").get<std::string>();
            payload = msg.value("payload", json::object());
        } catch (json::exception& e) {
            std::cerr << "Invalid packet from socket " << client_socket << ": " << e.what() << std::endl;
            continue;
        }

        if (action == protocol::C2S_JOIN) {
            handleJoin(client_socket, payload);
            continue;
        }
        if (action == protocol::C2S_LEAVE) {
            break;
        }

        if (getUserForSocket(client_socket).empty()) {
            json response;
            response["action"] = protocol::S2C_INFO;
            response["payload"]["message"] = "You must join before chatting.";
            sendMessageToSocket(client_socket, response);
            continue;
        }

        if (action == protocol::C2S_CHAT) {
            handleChat(client_socket, payload);
        } else if (action == protocol::C2S_CONTROL) {
            handleControl(client_socket, payload);
        } else {
            std::cerr << "Unknown action from socket " << client_socket << ": " << action << std::endl;
        }
    }
}

void ChatServer::handleJoin(int client_socket, const json& payload) {
    std::string name;
    if (payload.is_object() && payload.contains("name") && payload["name"].is_string()) {
        name = payload["name"].get<std::string>();
    }
    name.erase(name.begin(), std::find_if_not(name.begin(), name.end(), [](unsigned char c) { return std::isspace(c); }));
    name.erase(std::find_if_not(name.rbegin(), name.rend(), [](unsigned char c) { return std::isspace(c); }).base(), name.end());

    json response;
    if (!getUserForSocket(client_socket).empty()) {
        response["action"] = protocol::S2C_JOIN_FAILURE;
        response["payload"]["message"] = "Already joined.";
    } else if (name.empty() || name == m_bot_name) {
        response["action"] = protocol::S2C_JOIN_FAILURE;
        response["payload"]["message"] = "Invalid name.";
    } else if (!registerSession(client_socket, name)) {
        response["action"] = protocol::S2C_JOIN_FAILURE;
        response["payload"]["message"] = "Name " + name + " is already taken.";
    } else {
        response["action"] = protocol::S2C_WELCOME;
        response["payload"]["sender_id"] = name;
        response["payload"]["name"] = name;
        response["payload"]["is_operator"] = (!m_operator_name.empty() && name == m_operator_name);

        json info;
        info["action"] = protocol::S2C_INFO;
        info["payload"]["message"] = name + " joined the game.";
        broadcast(info, client_socket);
    }
    sendMessageToSocket(client_socket, response);
}

void ChatServer::handleChat(int client_socket, const json& payload) {
    if (!payload.is_object() || !payload.contains("body") || !payload["body"].is_string()) {
        std::cerr << "C2S_CHAT without body from socket " << client_socket << std::endl;
        return;
    }

    MessageEvent event;
    event.message_id = nextMessageId();
    event.sender_id = getUserForSocket(client_socket);
    event.sender_name = event.sender_id;
    event.body = payload["body"].get<std::string>();
    event.timestamp = serverTime();

    json chat;
    chat["action"] = protocol::S2C_CHAT;
    chat["payload"]["message_id"] = event.message_id;
    chat["payload"]["sender"] = event.sender_name;
    chat["payload"]["body"] = event.body;
    chat["payload"]["timestamp"] = *event.timestamp;
    broadcast(chat, client_socket);

    if (m_message_handler) {
        m_message_handler(event);
    }
}

void ChatServer::handleControl(int client_socket, const json& payload) {
    std::string user = getUserForSocket(client_socket);
    if (m_operator_name.empty() || user != m_operator_name) {
        json response;
        response["action"] = protocol::S2C_INFO;
        response["payload"]["message"] = "Only the operator can control the game.";
        sendMessageToSocket(client_socket, response);
        return;
    }

    std::string signal;
    if (payload.is_object() && payload.contains("signal") && payload["signal"].is_string()) {
        signal = payload["signal"].get<std::string>();
    }
    std::transform(signal.begin(), signal.end(), signal.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::cout << "Control signal from " << user << ": " << signal << std::endl;

    if (m_control_handler) {
        m_control_handler(signal);
    }
}

// ==========================================================
// CHAT TRANSPORT
// ==========================================================

std::string ChatServer::nextMessageId() {
    return "m" + std::to_string(m_next_message_id++);
}

double ChatServer::serverTime() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::duration<double>>(now).count();
}

void ChatServer::send(const std::string& text) {
    json chat;
    chat["action"] = protocol::S2C_CHAT;
    chat["payload"]["message_id"] = nextMessageId();
    chat["payload"]["sender"] = m_bot_name;
    chat["payload"]["body"] = text;
    chat["payload"]["timestamp"] = serverTime();
    broadcast(chat);
}

void ChatServer::reply(const std::string& text, const std::string& quoted_message_id) {
    json chat;
    chat["action"] = protocol::S2C_CHAT;
    chat["payload"]["message_id"] = nextMessageId();
    chat["payload"]["sender"] = m_bot_name;
    chat["payload"]["body"] = text;
    chat["payload"]["timestamp"] = serverTime();
    chat["payload"]["quoted_id"] = quoted_message_id;
    broadcast(chat);
}

void ChatServer::broadcastLeaderboard(const json& table) {
    json msg;
    msg["action"] = protocol::S2C_LEADERBOARD;
    msg["payload"]["entries"] = table;
    broadcast(msg);
}

// ==========================================================
// SESSIONS
// ==========================================================

void ChatServer::broadcast(const json& msg, int exclude_socket) {
    std::vector<int> targets;
    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        for (auto const& [sock, username] : m_socket_to_user) {
            if (sock != exclude_socket) targets.push_back(sock);
        }
    }
    for (int sock : targets) {
        sendMessageToSocket(sock, msg);
    }
}

void ChatServer::sendMessageToSocket(int client_sock, const json& msg) {
    std::lock_guard<std::mutex> lock(m_send_mutex);
    if (!protocol::sendMessage(client_sock, msg)) {
        std::cerr << "Failed to send to socket " << client_sock << std::endl;
    }
}

std::string ChatServer::getUserForSocket(int client_sock) {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    auto it = m_socket_to_user.find(client_sock);
    if (it != m_socket_to_user.end()) {
        return it->second;
    }
    return "";
}

bool ChatServer::registerSession(int client_sock, const std::string& username) {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    if (m_user_to_socket.count(username)) return false;
    m_socket_to_user[client_sock] = username;
    m_user_to_socket[username] = client_sock;
    std::cout << "Session registered: " << username << " is on socket " << client_sock << std::endl;
    return true;
}

void ChatServer::removeSession(int client_sock) {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    auto it = m_socket_to_user.find(client_sock);
    if (it != m_socket_to_user.end()) {
        std::string username = it->second;
        m_user_to_socket.erase(username);
        m_socket_to_user.erase(it);
        std::cout << "Session removed for socket " << client_sock << " (user: " << username << ")" << std::endl;
    }
}
