#pragma once

#include "address.hpp"
#include "platform/transport.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

enum class ConnectionErrorKind {
    ConnectFailed,   // transport could not be established
    ConnectionLost,  // an open transport failed mid-write or mid-read
    Cancelled,       // cancel check fired while waiting on the transport
    InvalidEncoding, // response is not valid UTF-8
};

struct ConnectionError {
    ConnectionErrorKind kind;
    std::string message;
};

std::string_view to_string(ConnectionErrorKind kind);

// Reconnecting connection to a line-oriented control socket. One exchange
// in flight at a time; not thread-safe.
class Connection {
public:
    static constexpr std::string_view END_MARKER = "\r\nEND\r\n";
    static constexpr std::string_view QUIT_COMMAND = "quit";
    static constexpr std::string_view QUIT_MARKER = "Bye!\r\n";
    static constexpr size_t BUFSIZE = 4096;

    using CancelCheck = std::function<bool()>;

    Connection(Address address, TransportFactory factory, bool verbose = false);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Opens a fresh transport, replacing any existing one.
    std::expected<void, ConnectionError> connect();

    // Sends `command` (trimmed, newline-terminated) and returns the reply
    // with `marker` stripped. Connects first if needed. Loss of the link is
    // reported, never retried here.
    std::expected<std::string, ConnectionError>
        send(std::string_view command, std::string_view marker = END_MARKER);

    // Best-effort quit handshake, then releases the transport. Never fails.
    void close();

    bool connected() const { return transport_ != nullptr; }
    const Address& address() const { return address_; }

    // Consulted whenever a read or write times out or is interrupted.
    void set_cancel_check(CancelCheck check) { cancel_check_ = std::move(check); }

private:
    std::expected<void, ConnectionError> write_all(std::string_view request);
    std::expected<std::string, ConnectionError> read_until(std::string_view marker);

    // Releases the transport after a failed exchange.
    void drop();
    bool cancelled() const;
    ConnectionError lost(std::string message);
    void log(const std::string& msg);

    Address address_;
    TransportFactory factory_;
    bool verbose_;
    CancelCheck cancel_check_;
    std::unique_ptr<Transport> transport_;
};

// Strips leading/trailing whitespace and appends a single '\n'.
std::string frame_command(std::string_view command);

bool is_valid_utf8(std::string_view text);
