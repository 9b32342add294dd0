#pragma once

#include <string>

struct Config {
    struct Connection {
        std::string address = "localhost:1234";
        int recv_timeout_ms = 100; // polling interval, not a reply deadline
    } connection;

    struct Console {
        std::string history_file; // empty disables history persistence
        bool color = true;
    } console;

    Config();

    static Config load(const std::string& path);
    static Config load_default();
};
