#include "platform/linux/socket_transport.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

IoError io_error(int err) {
    if (err == EAGAIN || err == EWOULDBLOCK) return {.status = IoStatus::Timeout, .code = err};
    if (err == EINTR) return {.status = IoStatus::Interrupted, .code = err};
    return {.status = IoStatus::Failed, .code = err};
}

bool set_timeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool valid_port(const std::string& port) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    return ec == std::errc() && ptr == port.data() + port.size() && value > 0 && value <= 65535;
}

std::expected<int, std::string> connect_tcp(const TcpAddress& addr) {
    if (!valid_port(addr.port)) {
        return std::unexpected(std::format("invalid port '{}'", addr.port));
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const char* host = addr.host.empty() ? nullptr : addr.host.c_str();
    int rc = ::getaddrinfo(host, addr.port.c_str(), &hints, &res);
    if (rc != 0) {
        return std::unexpected(std::format("cannot resolve '{}': {}", addr.host, gai_strerror(rc)));
    }

    int last_errno = 0;
    int fd = -1;
    for (auto* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last_errno = errno;
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        return std::unexpected(std::format("connect to {}:{} failed: {}",
                                           addr.host, addr.port, std::strerror(last_errno)));
    }
    return fd;
}

std::expected<int, std::string> connect_unix(const LocalAddress& addr) {
    sockaddr_un sun{};
    sun.sun_family = AF_UNIX;
    if (addr.path.empty() || addr.path.size() >= sizeof(sun.sun_path)) {
        return std::unexpected(std::format("invalid socket path '{}'", addr.path));
    }
    std::strncpy(sun.sun_path, addr.path.c_str(), sizeof(sun.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(std::format("socket() failed: {}", std::strerror(errno)));
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&sun), sizeof(sun)) < 0) {
        int err = errno;
        ::close(fd);
        return std::unexpected(std::format("connect to {} failed: {}", addr.path, std::strerror(err)));
    }
    return fd;
}

} // namespace

SocketTransport::SocketTransport(int fd) : fd_(fd) {}

SocketTransport::~SocketTransport() {
    close();
}

std::expected<std::unique_ptr<Transport>, std::string>
SocketTransport::open(const Address& address, std::chrono::milliseconds io_timeout) {
    auto fd = is_tcp(address) ? connect_tcp(std::get<TcpAddress>(address))
                              : connect_unix(std::get<LocalAddress>(address));
    if (!fd) return std::unexpected(fd.error());

    if (!set_timeouts(*fd, io_timeout)) {
        int err = errno;
        ::close(*fd);
        return std::unexpected(std::format("setsockopt failed: {}", std::strerror(err)));
    }
    return std::make_unique<SocketTransport>(*fd);
}

std::expected<size_t, IoError> SocketTransport::write(std::string_view data) {
    if (fd_ < 0) return std::unexpected(IoError{.status = IoStatus::Failed, .code = EBADF});
    ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (n < 0) return std::unexpected(io_error(errno));
    return static_cast<size_t>(n);
}

std::expected<size_t, IoError> SocketTransport::read(std::span<char> buf) {
    if (fd_ < 0) return std::unexpected(IoError{.status = IoStatus::Failed, .code = EBADF});
    ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
    if (n < 0) return std::unexpected(io_error(errno));
    return static_cast<size_t>(n);
}

void SocketTransport::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

TransportFactory socket_transport_factory(std::chrono::milliseconds io_timeout) {
    return [io_timeout](const Address& address) {
        return SocketTransport::open(address, io_timeout);
    };
}
