#include "connection.hpp"

#include <cstdint>
#include <cstring>
#include <print>

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

} // namespace

std::string_view to_string(ConnectionErrorKind kind) {
    switch (kind) {
    case ConnectionErrorKind::ConnectFailed: return "connection failed";
    case ConnectionErrorKind::ConnectionLost: return "connection lost";
    case ConnectionErrorKind::Cancelled: return "cancelled";
    case ConnectionErrorKind::InvalidEncoding: return "invalid encoding";
    }
    return "unknown error";
}

std::string frame_command(std::string_view command) {
    auto first = command.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) return "\n";
    auto last = command.find_last_not_of(WHITESPACE);
    std::string request(command.substr(first, last - first + 1));
    request.push_back('\n');
    return request;
}

bool is_valid_utf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }

        if (i + len > text.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

Connection::Connection(Address address, TransportFactory factory, bool verbose)
    : address_(std::move(address)), factory_(std::move(factory)), verbose_(verbose) {}

Connection::~Connection() {
    if (transport_) transport_->close();
}

std::expected<void, ConnectionError> Connection::connect() {
    if (transport_) drop();

    auto transport = factory_(address_);
    if (!transport) {
        return std::unexpected(ConnectionError{
            .kind = ConnectionErrorKind::ConnectFailed, .message = transport.error()});
    }
    transport_ = std::move(*transport);
    log("connected to " + to_string(address_));
    return {};
}

std::expected<std::string, ConnectionError>
Connection::send(std::string_view command, std::string_view marker) {
    if (!transport_) {
        if (auto res = connect(); !res) return std::unexpected(res.error());
    }

    if (auto res = write_all(frame_command(command)); !res) {
        return std::unexpected(res.error());
    }
    return read_until(marker);
}

void Connection::close() {
    if (!transport_) return;

    auto reply = send(QUIT_COMMAND, QUIT_MARKER);
    if (!reply) {
        log(std::string("quit failed: ") + reply.error().message);
    }

    // The quit exchange may already have dropped the transport.
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    log("disconnected from " + to_string(address_));
}

std::expected<void, ConnectionError> Connection::write_all(std::string_view request) {
    size_t total = 0;
    while (total < request.size()) {
        auto sent = transport_->write(request.substr(total));
        if (!sent) {
            if (sent.error().status == IoStatus::Failed) {
                return std::unexpected(lost(std::string("write failed: ") +
                                            std::strerror(sent.error().code)));
            }
            if (cancelled()) {
                drop();
                return std::unexpected(ConnectionError{
                    .kind = ConnectionErrorKind::Cancelled, .message = "interrupted while sending"});
            }
            continue;
        }
        if (*sent == 0) {
            return std::unexpected(lost("peer stopped accepting data"));
        }
        total += *sent;
    }
    return {};
}

std::expected<std::string, ConnectionError> Connection::read_until(std::string_view marker) {
    std::string reply;
    char buf[BUFSIZE];

    while (!reply.ends_with(marker)) {
        auto n = transport_->read(buf);
        if (!n) {
            if (n.error().status == IoStatus::Failed) {
                return std::unexpected(lost(std::string("read failed: ") +
                                            std::strerror(n.error().code)));
            }
            // Timeout is only a polling interval; keep waiting unless cancelled.
            if (cancelled()) {
                drop();
                return std::unexpected(ConnectionError{
                    .kind = ConnectionErrorKind::Cancelled, .message = "interrupted while waiting for reply"});
            }
            continue;
        }
        if (*n == 0) {
            return std::unexpected(lost("connection closed by peer"));
        }
        reply.append(buf, *n);
    }

    reply.resize(reply.size() - marker.size());
    if (!is_valid_utf8(reply)) {
        return std::unexpected(ConnectionError{
            .kind = ConnectionErrorKind::InvalidEncoding, .message = "reply is not valid UTF-8"});
    }
    return reply;
}

void Connection::drop() {
    if (transport_) {
        transport_->close();
        transport_.reset();
    }
}

bool Connection::cancelled() const {
    return cancel_check_ && cancel_check_();
}

ConnectionError Connection::lost(std::string message) {
    drop();
    log("connection lost: " + message);
    return ConnectionError{.kind = ConnectionErrorKind::ConnectionLost, .message = std::move(message)};
}

void Connection::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[liquidsoap-console] {}", msg);
    }
}
