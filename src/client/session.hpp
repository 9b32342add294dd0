#pragma once

#include "connection.hpp"

#include <expected>
#include <string>
#include <string_view>

// Scoped use of a Connection. The connection's close() (quit handshake and
// socket release) runs exactly once, when the session is closed or destroyed.
class Session {
public:
    explicit Session(Connection& connection);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Connects now instead of on first send.
    std::expected<void, ConnectionError> open();

    std::expected<std::string, ConnectionError> send(std::string_view command);

    void close();

    bool closed() const { return closed_; }
    Connection& connection() { return connection_; }

private:
    Connection& connection_;
    bool closed_ = false;
};
