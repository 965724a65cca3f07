#pragma once

#include <string>

struct Config {
    struct Model {
        std::string size = "tiny";
        std::string backend = "lan";
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string models_dir = "models";
    } model;

    struct Staging {
        std::string suffix = ".webm";
        std::string dir; // empty: system temp directory
    } staging;

    static Config load(const std::string& path);
    static Config load_default();
};
