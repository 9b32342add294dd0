#include "batch.hpp"

#include "session.hpp"

#include <print>
#include <string>

std::expected<void, ConnectionError> run_batch(Connection& connection, std::istream& input,
                                               std::ostream& out) {
    Session session(connection);

    std::string line;
    while (std::getline(input, line)) {
        auto reply = session.send(line);
        if (!reply) return std::unexpected(reply.error());
        std::println(out, "{}", *reply);
    }
    return {};
}
