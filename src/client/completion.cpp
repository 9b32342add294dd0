#include "completion.hpp"

#include <sstream>

std::vector<std::string> parse_command_names(std::string_view help_text, std::string_view prefix) {
    std::vector<std::string> names;
    std::string lead = "| " + std::string(prefix);

    size_t start = 0;
    while (start < help_text.size()) {
        auto end = help_text.find('\n', start);
        if (end == std::string_view::npos) end = help_text.size();
        auto line = help_text.substr(start, end - start);
        start = end + 1;

        if (!line.starts_with(lead)) continue;

        std::istringstream fields{std::string(line)};
        std::string bar, name;
        if (fields >> bar >> name) names.push_back(std::move(name));
    }
    return names;
}
