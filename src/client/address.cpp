#include "address.hpp"

Address parse_address(const std::string& text) {
    auto pos = text.find(':');
    if (pos == std::string::npos) {
        return LocalAddress{.path = text};
    }
    return TcpAddress{.host = text.substr(0, pos), .port = text.substr(pos + 1)};
}

std::string to_string(const Address& address) {
    if (auto* tcp = std::get_if<TcpAddress>(&address)) {
        return tcp->host + ":" + tcp->port;
    }
    return std::get<LocalAddress>(address).path;
}
