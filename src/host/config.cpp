#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("deep_link")) {
            auto& d = j["deep_link"];
            if (d.contains("scheme")) cfg.deep_link.scheme = d["scheme"].get<std::string>();
        }

        if (j.contains("window")) {
            auto& w = j["window"];
            if (w.contains("app_id")) cfg.window.app_id = w["app_id"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.deep_link.scheme.empty()) {
        std::println(stderr, "config: empty deep_link.scheme, using default");
        cfg.deep_link.scheme = Config{}.deep_link.scheme;
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
