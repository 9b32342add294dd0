#include "stream_line_editor.hpp"

StreamLineEditor::StreamLineEditor(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<std::string> StreamLineEditor::read_line(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    return line;
}
