#pragma once

#include <string>
#include <variant>

struct TcpAddress {
    std::string host;
    std::string port;
};

struct LocalAddress {
    std::string path;
};

using Address = std::variant<TcpAddress, LocalAddress>;

// "host:port" selects TCP (split at the first colon), anything without a
// colon is a Unix domain socket path.
Address parse_address(const std::string& text);

std::string to_string(const Address& address);

inline bool is_tcp(const Address& address) {
    return std::holds_alternative<TcpAddress>(address);
}
