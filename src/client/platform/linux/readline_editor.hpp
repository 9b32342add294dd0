#pragma once

#include "platform/line_editor.hpp"

#include <string>

// GNU readline front end. The history file is loaded on construction and
// written back on destruction; an empty path disables persistence.
// readline keeps global state, so only one instance may exist at a time.
class ReadlineEditor : public LineEditor {
public:
    explicit ReadlineEditor(std::string history_path, bool verbose = false);
    ~ReadlineEditor() override;

    ReadlineEditor(const ReadlineEditor&) = delete;
    ReadlineEditor& operator=(const ReadlineEditor&) = delete;

    std::optional<std::string> read_line(const std::string& prompt) override;
    void add_history(const std::string& line) override;
    void set_completer(Completer completer) override;

private:
    void log(const std::string& msg);

    std::string history_path_;
    bool verbose_;
};

namespace platform {

// True when an interactive line-editing backend can drive the terminal.
bool line_editing_available();

} // namespace platform
