#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config::Config() {
    console.history_file = platform::history_file();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("connection")) {
            auto& c = j["connection"];
            if (c.contains("address")) cfg.connection.address = c["address"].get<std::string>();
            if (c.contains("recv_timeout_ms")) {
                auto timeout = c["recv_timeout_ms"].get<int>();
                if (timeout > 0) {
                    cfg.connection.recv_timeout_ms = timeout;
                } else {
                    std::println(stderr, "config: recv_timeout_ms must be positive, keeping {}",
                                 cfg.connection.recv_timeout_ms);
                }
            }
        }

        if (j.contains("console")) {
            auto& c = j["console"];
            if (c.contains("history_file")) cfg.console.history_file = c["history_file"].get<std::string>();
            if (c.contains("color")) cfg.console.color = c["color"].get<bool>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
