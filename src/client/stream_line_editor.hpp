#pragma once

#include "platform/line_editor.hpp"

#include <istream>
#include <ostream>

// Plain line input for pipes and terminals without line editing. Keeps no
// history and offers no completion.
class StreamLineEditor : public LineEditor {
public:
    StreamLineEditor(std::istream& in, std::ostream& out);

    std::optional<std::string> read_line(const std::string& prompt) override;
    void add_history(const std::string&) override {}
    void set_completer(Completer) override {}

private:
    std::istream& in_;
    std::ostream& out_;
};
