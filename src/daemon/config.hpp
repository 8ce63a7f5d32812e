#pragma once

#include <string>

struct Config {
    struct Backend {
        std::string type = "lan";
        std::string url = "http://localhost:8080";
        std::string models_dir = "models"; // as seen by the server
        long timeout_seconds = 600;
    } backend;

    struct Model {
        std::string tier;      // empty: use the recommended tier
        bool autoload = true;
    } model;

    struct Transcription {
        bool auto_detect = true;
        bool translate = false;
        std::string language;  // forced language when auto_detect is off
    } transcription;

    struct History {
        std::string path;      // empty: <data_dir>/transcription_history.json
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
