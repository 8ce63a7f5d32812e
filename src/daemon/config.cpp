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

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("models_dir")) cfg.backend.models_dir = b["models_dir"].get<std::string>();
            if (b.contains("timeout_seconds")) cfg.backend.timeout_seconds = b["timeout_seconds"].get<long>();
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("tier")) cfg.model.tier = m["tier"].get<std::string>();
            if (m.contains("autoload")) cfg.model.autoload = m["autoload"].get<bool>();
        }

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            if (t.contains("auto_detect")) cfg.transcription.auto_detect = t["auto_detect"].get<bool>();
            if (t.contains("translate")) cfg.transcription.translate = t["translate"].get<bool>();
            if (t.contains("language")) cfg.transcription.language = t["language"].get<std::string>();
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
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
