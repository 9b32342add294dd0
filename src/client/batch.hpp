#pragma once

#include "connection.hpp"

#include <expected>
#include <istream>
#include <ostream>

// Sends every line of `input` as a command over one session and prints each
// reply. Stops at the first connection error; lines are not retried.
std::expected<void, ConnectionError> run_batch(Connection& connection, std::istream& input,
                                               std::ostream& out);
