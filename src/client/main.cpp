#include "batch.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "console.hpp"
#include "platform/interrupt.hpp"
#include "platform/linux/readline_editor.hpp"
#include "platform/linux/socket_transport.hpp"
#include "session.hpp"
#include "stream_line_editor.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

constexpr int EXIT_CONNECTION = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

void usage(const char* prog) {
    std::println("Usage: {} [options] [FILE...]", prog);
    std::println("Telnet client for Liquidsoap. Without files, starts an interactive console;");
    std::println("otherwise sends each line of each file as a command.");
    std::println("Options:");
    std::println("  -s, --socket ADDR   Socket address as host:port or Unix socket path");
    std::println("                      (default: localhost:1234)");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --history PATH  Command history file (empty disables)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -h, --help          Show this help");
}

int run_interactive(Connection& connection, const Config& config, bool verbose) {
    std::unique_ptr<LineEditor> editor;
    if (platform::line_editing_available()) {
        editor = std::make_unique<ReadlineEditor>(config.console.history_file, verbose);
    } else {
        if (verbose) std::println(stderr, "[liquidsoap-console] line editing unavailable, history disabled");
        editor = std::make_unique<StreamLineEditor>(std::cin, std::cout);
    }

    bool color = config.console.color && ::isatty(STDOUT_FILENO);

    ConsoleExit result;
    {
        Session session(connection);
        Console console(session, *editor, std::cout, std::cerr, color, verbose);
        console.set_interrupt_check(platform::interrupted);
        result = console.run();
        if (result == ConsoleExit::Interrupted) {
            std::println("Interrupted.");
            platform::clear_interrupt();
        }
    }

    switch (result) {
    case ConsoleExit::Quit:
    case ConsoleExit::EndOfInput:
        return 0;
    case ConsoleExit::Interrupted:
        return EXIT_INTERRUPTED;
    case ConsoleExit::ConnectFailed:
        return EXIT_CONNECTION;
    }
    return 0;
}

int run_files(Connection& connection, std::vector<std::ifstream>& files,
              const std::vector<std::string>& names) {
    for (size_t i = 0; i < files.size(); ++i) {
        auto res = run_batch(connection, files[i], std::cout);
        if (res) continue;

        if (res.error().kind == ConnectionErrorKind::Cancelled) {
            platform::clear_interrupt();
            std::println("Interrupted.");
            return EXIT_INTERRUPTED;
        }
        std::println(stderr, "error: {}: {}: {}", names[i], to_string(res.error().kind),
                     res.error().message);
        return EXIT_CONNECTION;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> socket_addr;
    std::optional<std::string> history_file;
    std::string config_path;
    bool verbose = false;
    std::vector<std::string> inputs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--socket" || arg == "-s") {
            if (i + 1 >= argc) {
                std::println(stderr, "{}: {} requires an argument", argv[0], arg);
                return EXIT_USAGE;
            }
            socket_addr = argv[++i];
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{}: {} requires an argument", argv[0], arg);
                return EXIT_USAGE;
            }
            config_path = argv[++i];
        } else if (arg == "--history") {
            if (i + 1 >= argc) {
                std::println(stderr, "{}: {} requires an argument", argv[0], arg);
                return EXIT_USAGE;
            }
            history_file = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::println(stderr, "{}: unknown option {}", argv[0], arg);
            return EXIT_USAGE;
        } else {
            inputs.push_back(arg);
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (socket_addr) config.connection.address = *socket_addr;
    if (history_file) config.console.history_file = *history_file;

    // Open every input up front so a bad path fails before anything is sent.
    std::vector<std::ifstream> files;
    for (const auto& name : inputs) {
        std::ifstream f(name);
        if (!f.is_open()) {
            std::println(stderr, "{}: can't open '{}'", argv[0], name);
            return EXIT_USAGE;
        }
        files.push_back(std::move(f));
    }

    if (!platform::install_interrupt_handler()) {
        std::println(stderr, "warning: could not install SIGINT handler");
    }

    auto address = parse_address(config.connection.address);
    if (verbose) {
        std::println(stderr, "[liquidsoap-console] using {} socket {}",
                     is_tcp(address) ? "TCP" : "Unix", to_string(address));
    }

    Connection connection(address,
                          socket_transport_factory(std::chrono::milliseconds(config.connection.recv_timeout_ms)),
                          verbose);
    connection.set_cancel_check(platform::interrupted);

    if (files.empty()) {
        return run_interactive(connection, config, verbose);
    }
    return run_files(connection, files, inputs);
}
