#include "session.hpp"

Session::Session(Connection& connection) : connection_(connection) {}

Session::~Session() {
    close();
}

std::expected<void, ConnectionError> Session::open() {
    if (connection_.connected()) return {};
    return connection_.connect();
}

std::expected<std::string, ConnectionError> Session::send(std::string_view command) {
    return connection_.send(command);
}

void Session::close() {
    if (closed_) return;
    closed_ = true;
    connection_.close();
}
