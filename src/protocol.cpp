#include "protocol.hpp"
#include <sys/socket.h>
#include <arpa/inet.h>
#include <cerrno>
#include <iostream>
#include <vector>

namespace {

bool sendAll(int socket, const char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = send(socket, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

bool recvAll(int socket, char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = recv(socket, data + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false; // disconnected or error
        total += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

/**
 * @brief Sends one JSON message, prefixed with its 4-byte big-endian length.
 */
bool protocol::sendMessage(int socket, const json& j) {
    try {
        std::string msg_str = j.dump();
        uint32_t len = static_cast<uint32_t>(msg_str.length());
        uint32_t net_len = htonl(len);

        if (!sendAll(socket, reinterpret_cast<const char*>(&net_len), sizeof(net_len))) return false;
        return sendAll(socket, msg_str.data(), len);
    } catch (const json::exception& e) {
        std::cerr << "Error in sendMessage: " << e.what() << std::endl;
        return false;
    }
}

/**
 * @brief Reads one length-prefixed JSON message.
 * Returns an empty json on disconnect, a bad length or malformed JSON.
 */
json protocol::receiveMessage(int socket) {
    uint32_t net_len;
    if (!recvAll(socket, reinterpret_cast<char*>(&net_len), sizeof(net_len))) {
        return json();
    }

    uint32_t len = ntohl(net_len);
    if (len == 0 || len > MAX_FRAME_BYTES) {
        std::cerr << "receiveMessage: bad frame length " << len << " on socket " << socket << std::endl;
        return json();
    }

    std::vector<char> buffer(len);
    if (!recvAll(socket, buffer.data(), len)) {
        return json();
    }

    try {
        return json::parse(buffer.begin(), buffer.end());
    } catch (const json::parse_error& e) {
        std::cerr << "receiveMessage: invalid JSON on socket " << socket << ": " << e.what() << std::endl;
        return json();
    }
}
