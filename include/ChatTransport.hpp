#pragma once
#include <string>

// Outbound side of the group chat. Calls are fire-and-forget: an
// implementation logs its own failures and nothing is retried.
class ChatTransport {
public:
    virtual ~ChatTransport() = default;

    virtual void send(const std::string& text) = 0;
    virtual void reply(const std::string& text, const std::string& quoted_message_id) = 0;

    // Epoch seconds on the same clock that stamps inbound messages.
    virtual double serverTime() = 0;
};
