#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  probe                                     Show memory, accelerator and recommended tier");
    std::println(stderr, "  load [TIER]                               Load tiny|base|small|medium|large");
    std::println(stderr, "  reload                                    Reload the current model");
    std::println(stderr, "  transcribe FILE [--translate] [--language L]");
    std::println(stderr, "                                            Transcribe an audio file");
    std::println(stderr, "  cancel                                    Cancel the running job");
    std::println(stderr, "  status                                    Show daemon status");
    std::println(stderr, "  history [--limit N]                       List transcription history");
    std::println(stderr, "  show N                                    Show history entry N");
    std::println(stderr, "  export N PATH                             Write history entry N to a text file");
    std::println(stderr, "  remove N                                  Delete history entry N");
    std::println(stderr, "  clear                                     Delete all history");
}

static std::optional<long> parse_number(const std::string& s) {
    long value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value < 0) return std::nullopt;
    return value;
}

static std::string absolute_path(const std::string& path) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(path, ec);
    return ec ? path : abs.lexically_normal().string();
}

static void print_entry(const json& entry) {
    std::println("File: {}", entry.value("file_name", "Unknown"));
    std::println("Language: {}", entry.value("language", "unknown"));
    std::println("Date: {}", entry.value("date", "Unknown"));
    auto path = entry.value("file_path", "");
    if (!path.empty()) std::println("Path: {}", path);
    std::println("");
    std::println("{}", entry.value("text", ""));
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    bool translate = false;
    std::string language;
    long limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--translate") {
            translate = true;
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            auto n = parse_number(argv[++i]);
            if (!n) {
                std::println(stderr, "Invalid limit: {}", argv[i]);
                return 1;
            }
            limit = *n;
        } else {
            positional.push_back(std::move(arg));
        }
    }

    auto need_index = [&](size_t count) -> std::optional<long> {
        if (positional.size() < count) return std::nullopt;
        return parse_number(positional[0]);
    };

    // Build command JSON
    json cmd;
    bool long_running = false;
    if (command == "probe" || command == "reload" || command == "cancel" ||
        command == "status" || command == "clear") {
        cmd = {{"cmd", command}};
        long_running = command == "reload";
    } else if (command == "load") {
        cmd = {{"cmd", "load"}};
        if (!positional.empty()) cmd["tier"] = positional[0];
        long_running = true;
    } else if (command == "transcribe") {
        if (positional.empty()) {
            std::println(stderr, "transcribe: missing FILE");
            return 1;
        }
        cmd = {{"cmd", "transcribe"}, {"path", absolute_path(positional[0])}};
        if (translate) cmd["translate"] = true;
        if (!language.empty()) {
            cmd["auto_detect"] = false;
            cmd["language"] = language;
        }
        long_running = true;
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "show" || command == "remove") {
        auto index = need_index(1);
        if (!index) {
            std::println(stderr, "{}: expected an entry number", command);
            return 1;
        }
        cmd = {{"cmd", command}, {"index", *index}};
    } else if (command == "export") {
        auto index = need_index(2);
        if (!index) {
            std::println(stderr, "export: expected an entry number and a destination path");
            return 1;
        }
        cmd = {{"cmd", "export"}, {"index", *index}, {"path", absolute_path(positional[1])}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is scribed running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    // Model loads and transcriptions can take minutes; progress lines come first.
    json response;
    while (true) {
        if (!client.recv(response, long_running ? -1 : 30000)) {
            std::println(stderr, "No response from daemon");
            return 1;
        }
        if (response.value("status", "") != "progress") break;
        std::println(stderr, "{}", response.value("message", ""));
    }

    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }
    if (status == "cancelled") {
        std::println(stderr, "Cancelled");
        return 1;
    }
    if (status != "ok") {
        std::println("{}", response.dump(2));
        return 0;
    }

    if (command == "probe") {
        std::println("Device: {}", response.value("device", "cpu"));
        auto accel = response.value("accelerator_name", "");
        if (!accel.empty()) {
            std::println("Accelerator: {} ({:.1f} GB)", accel,
                         response.value("accelerator_memory_gb", 0.0));
        }
        std::println("Available RAM: {:.1f} GB", response.value("available_ram_gb", 0.0));
        std::println("Recommended tier: {}", response.value("recommended_tier", "base"));
    } else if (command == "load" || command == "reload") {
        std::println("Model ready: {}", response.value("tier", ""));
    } else if (command == "transcribe") {
        std::println("{}", response.value("text", ""));
        std::println(stderr, "Language: {}, saved as history entry {}",
                     response.value("language", "unknown"), response.value("index", 0));
        if (response.contains("warning")) {
            std::println(stderr, "Warning: {}", response.value("warning", ""));
        }
    } else if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("tier")) {
            std::println("Model: {}", response["tier"].get<std::string>());
        }
        if (response.contains("loading_tier")) {
            std::println("Loading: {}", response["loading_tier"].get<std::string>());
        }
    } else if (command == "history") {
        if (response.contains("entries")) {
            for (auto& entry : response["entries"]) {
                std::println("[{}] {}  {} ({})", entry.value("index", 0), entry.value("date", ""),
                             entry.value("file_name", ""), entry.value("language", ""));
                std::println("  {}", entry.value("text", ""));
            }
        }
    } else if (command == "show") {
        if (response.contains("entry")) print_entry(response["entry"]);
    } else if (command == "remove") {
        std::println("{}", response.value("removed", false) ? "Removed" : "No such entry");
    } else {
        std::println("OK");
    }

    return 0;
}
