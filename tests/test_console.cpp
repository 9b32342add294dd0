#include <catch2/catch_test_macros.hpp>

#include "console.hpp"
#include "mock_transport.hpp"

#include <deque>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Feeds canned lines; std::nullopt entries (or running out) mean end of input.
class ScriptedEditor : public LineEditor {
public:
    ScriptedEditor() = default;
    ScriptedEditor(std::initializer_list<std::optional<std::string>> lines) : lines_(lines) {}

    std::optional<std::string> read_line(const std::string& prompt) override {
        prompts.push_back(prompt);
        if (lines_.empty()) return std::nullopt;
        auto line = lines_.front();
        lines_.pop_front();
        return line;
    }

    void add_history(const std::string& line) override { history.push_back(line); }
    void set_completer(Completer c) override { completer = std::move(c); }

    std::vector<std::string> prompts;
    std::vector<std::string> history;
    Completer completer;

private:
    std::deque<std::optional<std::string>> lines_;
};

const char* HELP_LISTING =
    "Available commands:\r\n"
    "| help [<command>]\r\n"
    "| output.file.start\r\n"
    "| output.file.stop\r\n"
    "| request.push <uri>\r\n"
    "| version";

std::string server_reply(const std::string& cmd) {
    if (cmd == "version") return "Liquidsoap 2.2.0";
    if (cmd == "help") return HELP_LISTING;
    if (cmd.starts_with("help ")) return "Usage: " + cmd.substr(5);
    return "ERROR: unknown command";
}

} // namespace

TEST_CASE("Console", "[console]") {
    MockNetwork net;
    Connection conn(parse_address("localhost:1234"), net.factory());
    std::ostringstream out, err;

    SECTION("RunsUntilExit") {
        auto link = net.add_link();
        link->responder = liquidsoap_responder(server_reply);
        ScriptedEditor editor{"version", "", "exit", "version"};

        {
            Session session(conn);
            Console console(session, editor, out, err, false);
            REQUIRE(console.run() == ConsoleExit::Quit);
        }

        REQUIRE(out.str() == "Interactive Liquidsoap console, type '?' for help.\n"
                             "Liquidsoap 2.2.0\n");
        REQUIRE(editor.prompts.size() == 3);
        REQUIRE(editor.prompts.front() == "> ");
        REQUIRE(editor.history == std::vector<std::string>{"version", "exit"});
        REQUIRE(link->requests == std::vector<std::string>{"version", "quit"});
        REQUIRE(err.str().empty());
    }

    SECTION("EndOfInput") {
        net.add_link()->responder = liquidsoap_responder(server_reply);
        ScriptedEditor editor{std::nullopt};
        Session session(conn);
        Console console(session, editor, out, err, false);

        REQUIRE(console.run() == ConsoleExit::EndOfInput);
        REQUIRE(out.str().ends_with("help.\n\n"));
    }

    SECTION("QuitMetaCommand") {
        auto link = net.add_link();
        link->responder = liquidsoap_responder(server_reply);
        ScriptedEditor editor{"  quit  "};
        Session session(conn);
        Console console(session, editor, out, err, false);

        REQUIRE(console.run() == ConsoleExit::Quit);
        REQUIRE(link->requests.empty());
    }

    SECTION("ColoredPromptAndIntro") {
        net.add_link()->responder = liquidsoap_responder(server_reply);
        ScriptedEditor editor;
        Session session(conn);
        Console console(session, editor, out, err, true);

        console.run();
        REQUIRE(editor.prompts.front() == "\033[01;33m>\033[00m ");
        REQUIRE(out.str().starts_with("\033[33mInteractive"));
    }

    SECTION("UnreachableServerEndsSession") {
        ScriptedEditor editor{"version"};
        Session session(conn);
        Console console(session, editor, out, err, false);

        REQUIRE(console.run() == ConsoleExit::ConnectFailed);
        REQUIRE(editor.prompts.empty());
        REQUIRE(err.str().starts_with("error: connection failed"));
    }

    SECTION("InterruptEndsSession") {
        net.add_link()->responder = liquidsoap_responder(server_reply);
        ScriptedEditor editor{"version"};
        Session session(conn);
        Console console(session, editor, out, err, false);
        console.set_interrupt_check([] { return true; });

        REQUIRE(console.run() == ConsoleExit::Interrupted);
    }

    SECTION("HelpForwarded") {
        auto link = net.add_link();
        link->responder = liquidsoap_responder(server_reply);
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE_FALSE(console.dispatch("help request.push"));
        REQUIRE_FALSE(console.dispatch("? output.file.start"));
        REQUIRE_FALSE(console.dispatch("?"));
        REQUIRE(link->requests ==
                std::vector<std::string>{"help request.push", "help output.file.start", "help"});
        REQUIRE(out.str().starts_with("Usage: request.push\nUsage: output.file.start\nAvailable commands:"));
    }

    SECTION("OtherInputForwardedVerbatim") {
        auto link = net.add_link();
        link->responder = liquidsoap_responder(server_reply);
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE_FALSE(console.dispatch("  var.set volume = 0.5 "));
        REQUIRE_FALSE(console.dispatch("exits"));
        REQUIRE(link->requests == std::vector<std::string>{"var.set volume = 0.5", "exits"});
    }

    SECTION("LostConnectionRetriedOnce") {
        net.add_link()->push_eof();
        auto second = net.add_link();
        second->responder = liquidsoap_responder(server_reply);
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE_FALSE(console.dispatch("version"));
        REQUIRE(out.str() == "Liquidsoap 2.2.0\n");
        REQUIRE(err.str().empty());
        REQUIRE(net.connects() == 2);
        REQUIRE(second->requests == std::vector<std::string>{"version"});
    }

    SECTION("SecondLossReportedSessionContinues") {
        net.add_link()->push_eof();
        net.add_link()->push_eof();
        auto third = net.add_link();
        third->responder = liquidsoap_responder(server_reply);
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE_FALSE(console.dispatch("version"));
        REQUIRE(err.str().starts_with("error: connection lost"));
        REQUIRE(out.str().empty());
        REQUIRE(net.connects() == 2);

        REQUIRE_FALSE(console.dispatch("version"));
        REQUIRE(out.str() == "Liquidsoap 2.2.0\n");
    }

    SECTION("ReconnectFailureEndsSession") {
        net.add_link()->push_eof();
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE(console.dispatch("version") == ConsoleExit::ConnectFailed);
        REQUIRE(err.str().starts_with("error: connection failed"));
    }

    SECTION("InvalidEncodingReported") {
        net.add_link()->responder = [](const std::string&) { return std::string("\xFF\r\nEND\r\n"); };
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE_FALSE(console.dispatch("version"));
        REQUIRE(err.str().starts_with("error: invalid encoding"));
        REQUIRE(net.connects() == 1);
    }

    SECTION("CancelledExchangeInterrupts") {
        auto link = net.add_link();
        link->push_error(IoStatus::Interrupted);
        conn.set_cancel_check([] { return true; });
        Session session(conn);
        ScriptedEditor editor;
        Console console(session, editor, out, err, false);

        REQUIRE(console.dispatch("version") == ConsoleExit::Interrupted);
    }
}

TEST_CASE("Console completion", "[console][completion]") {
    MockNetwork net;
    Connection conn(parse_address("localhost:1234"), net.factory());
    std::ostringstream out, err;
    Session session(conn);
    ScriptedEditor editor;
    Console console(session, editor, out, err, false);

    SECTION("MetaAndServerCommands") {
        auto link = net.add_link();
        link->responder = liquidsoap_responder(server_reply);

        REQUIRE(console.complete("h") == std::vector<std::string>{"help", "help"});
        REQUIRE(console.complete("output.file.s") ==
                std::vector<std::string>{"output.file.start", "output.file.stop"});
        REQUIRE(console.complete("e") == std::vector<std::string>{"exit"});
        REQUIRE(link->requests == std::vector<std::string>{"help", "help", "help"});
    }

    SECTION("InstalledOnEditorByRun") {
        net.add_link()->responder = liquidsoap_responder(server_reply);
        console.run();
        REQUIRE(editor.completer);
        REQUIRE(editor.completer("req") == std::vector<std::string>{"request.push"});
    }

    SECTION("ServerUnavailable") {
        REQUIRE(console.complete("") == std::vector<std::string>{"exit", "help", "quit"});
        REQUIRE(out.str().empty());
        REQUIRE(err.str().empty());
    }
}
