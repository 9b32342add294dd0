#pragma once

#include "platform/line_editor.hpp"
#include "session.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

enum class ConsoleExit { Quit, EndOfInput, Interrupted, ConnectFailed };

// Interactive command loop. Local meta-commands (help, ?, exit, quit) are
// handled first; any other line goes to the server unchanged.
class Console {
public:
    Console(Session& session, LineEditor& editor, std::ostream& out, std::ostream& err,
            bool color = true, bool verbose = false);

    ConsoleExit run();

    // Handles one input line. Returns a value when the loop should stop.
    std::optional<ConsoleExit> dispatch(const std::string& line);

    // Single-command path: a lost connection is retried once, reconnecting.
    std::expected<std::string, ConnectionError> send(std::string_view command);

    // Meta-commands and server commands starting with `prefix`.
    std::vector<std::string> complete(std::string_view prefix);

    void set_interrupt_check(std::function<bool()> check) { interrupt_check_ = std::move(check); }

    std::string prompt() const;
    std::string intro() const;

private:
    void report(const ConnectionError& error);
    void log(const std::string& msg);

    Session& session_;
    LineEditor& editor_;
    std::ostream& out_;
    std::ostream& err_;
    bool color_;
    bool verbose_;
    std::function<bool()> interrupt_check_;
};
