#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace protocol {
    // Frame: 4-byte big-endian length, then that many bytes of JSON.
    bool sendMessage(int socket, const json& j);
    // Empty json on disconnect, oversize frame or parse error.
    json receiveMessage(int socket);

    const uint32_t MAX_FRAME_BYTES = 1024 * 1024;

    // === Client -> Server ===
    const std::string C2S_JOIN = "C2S_JOIN";         // {name}
    const std::string C2S_CHAT = "C2S_CHAT";         // {body}
    const std::string C2S_CONTROL = "C2S_CONTROL";   // {signal}, operator only
    const std::string C2S_LEAVE = "C2S_LEAVE";

    // === Server -> Client ===
    const std::string S2C_WELCOME = "S2C_WELCOME";           // {sender_id, name}
    const std::string S2C_JOIN_FAILURE = "S2C_JOIN_FAILURE"; // {message}
    const std::string S2C_CHAT = "S2C_CHAT";                 // {message_id, sender, body, timestamp, quoted_id?}
    const std::string S2C_INFO = "S2C_INFO";                 // {message}
    const std::string S2C_LEADERBOARD = "S2C_LEADERBOARD";   // {entries}

    // Control signals
    const std::string SIGNAL_START = "START";
    const std::string SIGNAL_STOP = "STOP";
    const std::string SIGNAL_REP = "REP";
    const std::string SIGNAL_NEXT = "NEXT";
}
