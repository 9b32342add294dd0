#pragma once

#include "platform/transport.hpp"

#include <chrono>

class SocketTransport : public Transport {
public:
    explicit SocketTransport(int fd);
    ~SocketTransport() override;

    SocketTransport(const SocketTransport&) = delete;
    SocketTransport& operator=(const SocketTransport&) = delete;

    // Opens a TCP or Unix stream socket for `address`. Send and receive
    // timeouts are set to `io_timeout` so blocked calls return periodically.
    static std::expected<std::unique_ptr<Transport>, std::string>
        open(const Address& address, std::chrono::milliseconds io_timeout);

    std::expected<size_t, IoError> write(std::string_view data) override;
    std::expected<size_t, IoError> read(std::span<char> buf) override;
    void close() override;

    int fd() const { return fd_; }

private:
    int fd_ = -1;
};

// Factory used by Connection outside of tests.
TransportFactory socket_transport_factory(std::chrono::milliseconds io_timeout);
