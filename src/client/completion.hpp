#pragma once

#include <string>
#include <string_view>
#include <vector>

// Extracts command names from the server's "help" listing. Each command is
// listed on a line of the form "| name [args]"; only names starting with
// `prefix` are returned, in listing order.
std::vector<std::string> parse_command_names(std::string_view help_text, std::string_view prefix);
