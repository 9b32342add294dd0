#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class LineEditor {
public:
    using Completer = std::function<std::vector<std::string>(std::string_view prefix)>;

    virtual ~LineEditor() = default;

    // Returns std::nullopt at end of input.
    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
    virtual void add_history(const std::string& line) = 0;
    virtual void set_completer(Completer completer) = 0;
};
