#include <catch2/catch_test_macros.hpp>

#include "connection.hpp"
#include "fake_server.hpp"
#include "platform/linux/socket_transport.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::string reply_for(const std::string& cmd) {
    if (cmd == "version") return "Liquidsoap 2.2.0";
    return "echo " + cmd;
}

} // namespace

TEST_CASE("Socket transport", "[transport]") {
    auto factory = socket_transport_factory(50ms);

    SECTION("UnixSocketRoundTrip") {
        FakeServer server(false);
        std::vector<std::string> seen;
        server.serve({[&seen](int fd) { seen = FakeServer::answer(fd, reply_for); }});

        Connection conn(parse_address(server.address()), factory);
        REQUIRE_FALSE(is_tcp(conn.address()));
        REQUIRE(conn.send("version").value() == "Liquidsoap 2.2.0");
        REQUIRE(conn.send(" request.push /a.mp3 ").value() == "echo request.push /a.mp3");
        conn.close();
        REQUIRE_FALSE(conn.connected());

        server.wait();
        REQUIRE(seen == std::vector<std::string>{"version", "request.push /a.mp3", "quit"});
    }

    SECTION("TcpRoundTrip") {
        FakeServer server(true);
        server.serve({[](int fd) { FakeServer::answer(fd, reply_for); }});

        Connection conn(parse_address(server.address()), factory);
        REQUIRE(is_tcp(conn.address()));
        REQUIRE(conn.send("version").value() == "Liquidsoap 2.2.0");
        conn.close();
    }

    SECTION("SlowReplySurvivesPollingTimeout") {
        FakeServer server(false);
        server.serve({[](int fd) {
            if (!FakeServer::read_line(fd)) return;
            FakeServer::write_all(fd, "Liquidsoap 2.2.0\r\nE");
            std::this_thread::sleep_for(200ms);
            FakeServer::write_all(fd, "ND\r\n");
            FakeServer::answer(fd, reply_for);
        }});

        Connection conn(parse_address(server.address()), factory);
        REQUIRE(conn.send("version").value() == "Liquidsoap 2.2.0");
        conn.close();
    }

    SECTION("IdleDisconnectThenReconnect") {
        FakeServer server(false);
        std::vector<std::string> second_seen;
        server.serve({
            [](int fd) {
                // Answer one command, then hang up like an idle timeout.
                if (auto line = FakeServer::read_line(fd)) {
                    FakeServer::write_all(fd, reply_for(*line) + "\r\nEND\r\n");
                }
            },
            [&second_seen](int fd) { second_seen = FakeServer::answer(fd, reply_for); },
        });

        Connection conn(parse_address(server.address()), factory);
        REQUIRE(conn.send("version").value() == "Liquidsoap 2.2.0");
        std::this_thread::sleep_for(50ms);

        auto lost = conn.send("status");
        REQUIRE_FALSE(lost);
        REQUIRE(lost.error().kind == ConnectionErrorKind::ConnectionLost);
        REQUIRE_FALSE(conn.connected());

        REQUIRE(conn.send("status").value() == "echo status");
        conn.close();

        server.wait();
        REQUIRE(second_seen == std::vector<std::string>{"status", "quit"});
    }

    SECTION("MissingSocketPath") {
        Connection conn(parse_address("/tmp/lsc_test_no_such_socket.sock"), factory);
        auto res = conn.connect();
        REQUIRE_FALSE(res);
        REQUIRE(res.error().kind == ConnectionErrorKind::ConnectFailed);
        REQUIRE_FALSE(conn.connected());
    }

    SECTION("InvalidPort") {
        for (auto addr : {"localhost:abc", "localhost:", "localhost:0", "localhost:70000", "::1"}) {
            auto res = SocketTransport::open(parse_address(addr), 50ms);
            REQUIRE_FALSE(res);
            REQUIRE(res.error().starts_with("invalid port"));
        }
    }

    SECTION("SocketPathTooLong") {
        auto res = SocketTransport::open(parse_address("/tmp/" + std::string(200, 'x')), 50ms);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().starts_with("invalid socket path"));
    }

    SECTION("ReadTimesOutWithoutData") {
        FakeServer server(false);
        server.serve({[](int fd) { FakeServer::read_line(fd); }});

        auto transport = SocketTransport::open(parse_address(server.address()), 50ms);
        REQUIRE(transport);
        char buf[16];
        auto n = (*transport)->read(buf);
        REQUIRE_FALSE(n);
        REQUIRE(n.error().status == IoStatus::Timeout);

        (*transport)->close();
        auto after = (*transport)->read(buf);
        REQUIRE_FALSE(after);
        REQUIRE(after.error().status == IoStatus::Failed);
    }
}
