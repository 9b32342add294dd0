#include "platform/linux/readline_editor.hpp"

#include "platform/interrupt.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <unistd.h>
#include <vector>

#include <readline/history.h>
#include <readline/readline.h>

namespace {

LineEditor::Completer g_completer;
std::vector<std::string> g_matches;

// Replaces rl_getc so that an interrupt ends the current read_line() instead
// of being swallowed by the EINTR retry inside readline.
int interruptible_getc(FILE* stream) {
    while (true) {
        unsigned char c;
        ssize_t n = ::read(fileno(stream), &c, 1);
        if (n == 1) return c;
        if (n == 0) return EOF;
        if (errno != EINTR || platform::interrupted()) return EOF;
    }
}

// Marks ANSI color sequences as invisible so readline measures the prompt
// correctly.
std::string mark_invisible(const std::string& prompt) {
    std::string out;
    size_t i = 0;
    while (i < prompt.size()) {
        if (prompt[i] == '\033') {
            auto end = prompt.find('m', i);
            if (end != std::string::npos) {
                out += '\001';
                out.append(prompt, i, end - i + 1);
                out += '\002';
                i = end + 1;
                continue;
            }
        }
        out += prompt[i++];
    }
    return out;
}

char* match_generator(const char*, int state) {
    static size_t index;
    if (state == 0) index = 0;
    if (index < g_matches.size()) return ::strdup(g_matches[index++].c_str());
    return nullptr;
}

char** complete_command(const char* text, int start, int) {
    rl_attempted_completion_over = 1;
    // Only the command name is completed.
    if (start != 0 || !g_completer) return nullptr;
    g_matches = g_completer(text);
    return rl_completion_matches(text, match_generator);
}

} // namespace

ReadlineEditor::ReadlineEditor(std::string history_path, bool verbose)
    : history_path_(std::move(history_path)), verbose_(verbose) {
    rl_catch_signals = 0;
    rl_getc_function = interruptible_getc;
    rl_attempted_completion_function = complete_command;
    using_history();

    if (history_path_.empty()) return;
    if (!std::filesystem::exists(history_path_)) {
        log("no history file at " + history_path_);
        return;
    }
    if (int err = read_history(history_path_.c_str()); err != 0) {
        std::println(stderr, "history: could not read {}: {}", history_path_, std::strerror(err));
    } else {
        log("history loaded from " + history_path_);
    }
}

ReadlineEditor::~ReadlineEditor() {
    rl_attempted_completion_function = nullptr;
    rl_getc_function = rl_getc;
    g_completer = nullptr;
    g_matches.clear();

    if (history_path_.empty()) return;
    if (int err = write_history(history_path_.c_str()); err != 0) {
        std::println(stderr, "history: could not write {}: {}", history_path_, std::strerror(err));
    } else {
        log("history saved to " + history_path_);
    }
}

std::optional<std::string> ReadlineEditor::read_line(const std::string& prompt) {
    char* input = readline(mark_invisible(prompt).c_str());
    if (!input) return std::nullopt;
    std::string line(input);
    std::free(input);
    return line;
}

void ReadlineEditor::add_history(const std::string& line) {
    ::add_history(line.c_str());
}

void ReadlineEditor::set_completer(Completer completer) {
    g_completer = std::move(completer);
}

void ReadlineEditor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[liquidsoap-console] {}", msg);
    }
}

namespace platform {

bool line_editing_available() {
    return ::isatty(STDIN_FILENO) && ::isatty(STDOUT_FILENO);
}

} // namespace platform
