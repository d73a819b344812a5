#pragma once

#include <string>

namespace binbot {

/**
 * Message transport beneath the venue connector.
 * One thread owns receive() and close(); send() and interrupt() may be
 * called from any thread.
 */
class Transport {
public:
    virtual ~Transport() = default;

    // Open the connection and complete the protocol handshake
    virtual bool open() = 0;

    // Send one text message; false if the connection is not usable
    virtual bool send(const std::string& text) = 0;

    // Block until the next text message. Empty when the connection dropped
    // or receive was interrupted.
    virtual std::string receive() = 0;

    // Unblock a pending receive(); the connection is unusable afterwards
    virtual void interrupt() = 0;

    // Release the connection
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace binbot
