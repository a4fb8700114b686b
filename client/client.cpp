#include <iostream>
#include <string>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <thread>
#include <atomic>
#include <cstdlib>
#include <cstdio>
#include <cctype>
#include "../include/protocol.hpp"
#include <nlohmann/json.hpp>

#define SERVER_IP "127.0.0.1"
#define PORT 8081

using json = nlohmann::json;

std::atomic<bool> g_running(true);
std::atomic<bool> g_joined(false);

void printHelp() {
    std::cout << "Type an answer and press Enter to send it to the group." << std::endl;
    std::cout << "Operator commands: /start /stop /rep /next" << std::endl;
    std::cout << "/quit to leave" << std::endl;
}

void printLeaderboard(const json& entries) {
    std::cout << "\n=== LEADERBOARD ===" << std::endl;
    int i = 1;
    for (const auto& entry : entries) {
        std::cout << "Q" << i++ << ": " << entry.value("question", "") << std::endl;
        const json& winners = entry.value("winners", json::array());
        if (winners.empty()) {
            std::cout << "  No correct answers" << std::endl;
            continue;
        }
        int j = 1;
        for (const auto& w : winners) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1fs", w.value("response_time", 0.0));
            std::cout << "  " << j++ << ". " << w.value("name", "") << " - " << buf << std::endl;
        }
    }
}

// Receives and prints everything the server sends.
void listenToServer(int sock) {
    while (g_running) {
        json msg = protocol::receiveMessage(sock);
        if (msg.empty()) {
            std::cout << "\n[!] Server disconnected." << std::endl;
            g_running = false;
            break;
        }

        std::string action;
        json payload;
        try {
            action = msg.at("action").get<std::string>();
            payload = msg.value("payload", json::object());
        } catch (json::exception& e) {
            continue;
        }

        try {
            if (action == protocol::S2C_WELCOME) {
                g_joined = true;
                std::cout << "=> Joined as " << payload.value("name", "") << std::endl;
                if (payload.value("is_operator", false)) {
                    std::cout << "   You are the operator. Send /start when everyone is in." << std::endl;
                }
                printHelp();
            } else if (action == protocol::S2C_JOIN_FAILURE) {
                std::cout << "=> JOIN FAILED: " << payload.value("message", "") << std::endl;
                std::cout << "Name: ";
                std::cout.flush();
            } else if (action == protocol::S2C_CHAT) {
                std::cout << "[" << payload.value("sender", "?") << "] ";
                if (payload.contains("quoted_id")) {
                    std::cout << "(re: " << payload.value("quoted_id", "") << ") ";
                }
                std::cout << payload.value("body", "") << std::endl;
            } else if (action == protocol::S2C_INFO) {
                std::cout << "[INFO] " << payload.value("message", "") << std::endl;
            } else if (action == protocol::S2C_LEADERBOARD) {
                printLeaderboard(payload.value("entries", json::array()));
            } else {
                std::cout << "[DEBUG] RECV: " << msg.dump(2) << std::endl;
            }
        } catch (json::exception& e) {
            std::cerr << "[!] Malformed message: " << e.what() << std::endl;
        }
    }
}

void handleUserInput(int sock) {
    std::string line;

    std::cout << "Name: ";
    std::cout.flush();
    while (g_running && std::getline(std::cin, line)) {
        if (line.empty()) continue;

        json msg;
        if (!g_joined) {
            msg["action"] = protocol::C2S_JOIN;
            msg["payload"]["name"] = line;
        } else if (line == "/quit") {
            msg["action"] = protocol::C2S_LEAVE;
            protocol::sendMessage(sock, msg);
            break;
        } else if (line == "/start" || line == "/stop" || line == "/rep" || line == "/next") {
            std::string signal = line.substr(1);
            for (auto& c : signal) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            msg["action"] = protocol::C2S_CONTROL;
            msg["payload"]["signal"] = signal;
        } else if (line == "/help") {
            printHelp();
            continue;
        } else {
            msg["action"] = protocol::C2S_CHAT;
            msg["payload"]["body"] = line;
        }

        if (!protocol::sendMessage(sock, msg)) {
            std::cout << "[!] Failed to send message." << std::endl;
            break;
        }
    }

    g_running = false;
    shutdown(sock, SHUT_RDWR); // wakes the listener
}

int main(int argc, char* argv[]) {
    int sock = 0;
    sockaddr_in serv_addr{};
    int port = PORT;
    std::string ip = SERVER_IP;

    if (argc == 3) {
        ip = argv[1];
        port = std::atoi(argv[2]);
    } else if (argc != 1) {
        std::cerr << "Usage: " << argv[0] << " [Server IP] [Server Port]" << std::endl;
        std::cerr << "Running with default: 127.0.0.1:8081" << std::endl;
    }

    if ((sock = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
        perror("Socket creation error");
        return -1;
    }

    serv_addr.sin_family = AF_INET;
    serv_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &serv_addr.sin_addr) <= 0) {
        perror("Invalid address");
        return -1;
    }
    if (connect(sock, (struct sockaddr *)&serv_addr, sizeof(serv_addr)) < 0) {
        perror("Connection Failed");
        return -1;
    }
    std::cout << "Connected to server " << ip << ":" << port << std::endl;

    std::thread listenerThread(listenToServer, sock);

    handleUserInput(sock);

    listenerThread.join();
    close(sock);

    std::cout << "Exiting." << std::endl;
    return 0;
}
