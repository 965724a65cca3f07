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

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("size")) cfg.model.size = m["size"].get<std::string>();
            if (m.contains("backend")) cfg.model.backend = m["backend"].get<std::string>();
            if (m.contains("url")) cfg.model.url = m["url"].get<std::string>();
            if (m.contains("api_format")) cfg.model.api_format = m["api_format"].get<std::string>();
            if (m.contains("models_dir")) cfg.model.models_dir = m["models_dir"].get<std::string>();
        }

        if (j.contains("staging")) {
            auto& s = j["staging"];
            if (s.contains("suffix")) cfg.staging.suffix = s["suffix"].get<std::string>();
            if (s.contains("dir")) cfg.staging.dir = s["dir"].get<std::string>();
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
