#include "console.hpp"

#include "completion.hpp"

#include <array>
#include <ostream>
#include <print>

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";
constexpr std::array<std::string_view, 3> META_COMMANDS = {"exit", "help", "quit"};

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

} // namespace

Console::Console(Session& session, LineEditor& editor, std::ostream& out, std::ostream& err,
                 bool color, bool verbose)
    : session_(session), editor_(editor), out_(out), err_(err), color_(color), verbose_(verbose) {}

std::string Console::prompt() const {
    return color_ ? "\033[01;33m>\033[00m " : "> ";
}

std::string Console::intro() const {
    std::string text = "Interactive Liquidsoap console, type '?' for help.";
    return color_ ? "\033[33m" + text + "\033[00m" : text;
}

ConsoleExit Console::run() {
    if (auto res = session_.open(); !res) {
        report(res.error());
        return ConsoleExit::ConnectFailed;
    }

    editor_.set_completer([this](std::string_view prefix) { return complete(prefix); });
    std::println(out_, "{}", intro());

    while (true) {
        auto line = editor_.read_line(prompt());
        if (interrupt_check_ && interrupt_check_()) return ConsoleExit::Interrupted;
        if (!line) {
            std::println(out_, "");
            return ConsoleExit::EndOfInput;
        }
        if (auto exit = dispatch(*line)) return *exit;
    }
}

std::optional<ConsoleExit> Console::dispatch(const std::string& line) {
    auto trimmed = trim(line);
    if (trimmed.empty()) return std::nullopt;
    editor_.add_history(line);

    std::string command;
    if (trimmed.front() == '?') {
        auto topic = trim(trimmed.substr(1));
        command = topic.empty() ? "help" : "help " + std::string(topic);
    } else {
        auto word_end = trimmed.find_first_of(WHITESPACE);
        auto word = trimmed.substr(0, word_end);
        auto arg = word_end == std::string_view::npos ? std::string_view{}
                                                      : trim(trimmed.substr(word_end));
        if (word == "exit" || word == "quit") return ConsoleExit::Quit;
        if (word == "help") {
            command = arg.empty() ? "help" : "help " + std::string(arg);
        } else {
            command = std::string(trimmed);
        }
    }

    auto reply = send(command);
    if (reply) {
        std::println(out_, "{}", *reply);
        return std::nullopt;
    }

    switch (reply.error().kind) {
    case ConnectionErrorKind::Cancelled:
        return ConsoleExit::Interrupted;
    case ConnectionErrorKind::ConnectFailed:
        report(reply.error());
        return ConsoleExit::ConnectFailed;
    case ConnectionErrorKind::ConnectionLost:
    case ConnectionErrorKind::InvalidEncoding:
        report(reply.error());
        return std::nullopt;
    }
    return std::nullopt;
}

std::expected<std::string, ConnectionError> Console::send(std::string_view command) {
    auto reply = session_.send(command);
    if (!reply && reply.error().kind == ConnectionErrorKind::ConnectionLost) {
        log("connection lost (" + reply.error().message + "), retrying");
        reply = session_.send(command);
    }
    return reply;
}

std::vector<std::string> Console::complete(std::string_view prefix) {
    std::vector<std::string> names;
    for (auto name : META_COMMANDS) {
        if (name.starts_with(prefix)) names.emplace_back(name);
    }

    auto help = send("help");
    if (!help) {
        log("completion unavailable: " + help.error().message);
        return names;
    }
    for (auto& name : parse_command_names(*help, prefix)) {
        names.push_back(std::move(name));
    }
    return names;
}

void Console::report(const ConnectionError& error) {
    std::println(err_, "error: {}: {}", to_string(error.kind), error.message);
}

void Console::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[liquidsoap-console] {}", msg);
    }
}
