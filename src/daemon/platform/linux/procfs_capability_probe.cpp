#include "platform/linux/procfs_capability_probe.hpp"

#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <print>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace {

std::string read_first_line(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) return {};
    std::string line;
    std::getline(f, line);
    return line;
}

std::string trim(const std::string& s) {
    auto start_pos = s.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = s.find_last_not_of(" \t\n\r");
    return s.substr(start_pos, end_pos - start_pos + 1);
}

} // namespace

ProcfsCapabilityProbe::ProcfsCapabilityProbe(std::string proc_root, std::string sys_root)
    : proc_root_(std::move(proc_root)), sys_root_(std::move(sys_root)) {}

CapabilityReport ProcfsCapabilityProbe::probe() const {
    CapabilityReport report;

    auto ram = read_available_ram_gb();
    if (!ram) {
        Error err{ErrorKind::ResourceProbeFailure, "no MemAvailable in " + proc_root_ + "/meminfo"};
        std::println(stderr, "capability: {}", describe(err));
        return report;
    }

    report.available_ram_gb = *ram;
    report.recommended_tier = recommend_tier(*ram);

    auto accel = find_nvidia();
    if (!accel) accel = find_amd();
    if (accel) {
        report.device = ComputeDevice::Accelerator;
        report.accelerator_name = accel->name;
        report.accelerator_memory_gb = accel->memory_gb;
    }

    return report;
}

std::optional<double> ProcfsCapabilityProbe::read_available_ram_gb() const {
    std::ifstream f(fs::path(proc_root_) / "meminfo");
    if (!f.is_open()) return std::nullopt;

    constexpr std::string_view key = "MemAvailable:";
    std::string line;
    while (std::getline(f, line)) {
        if (!line.starts_with(key)) continue;

        std::istringstream ss(line.substr(key.size()));
        uint64_t kb = 0;
        if (!(ss >> kb)) return std::nullopt;
        return static_cast<double>(kb) * 1024.0 / 1e9;
    }
    return std::nullopt;
}

std::optional<ProcfsCapabilityProbe::Accelerator> ProcfsCapabilityProbe::find_nvidia() const {
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(fs::path(proc_root_) / "driver/nvidia/gpus", ec)) {
        std::ifstream f(entry.path() / "information");
        if (!f.is_open()) continue;

        std::string line;
        while (std::getline(f, line)) {
            if (line.starts_with("Model:")) {
                return Accelerator{.name = trim(line.substr(6))};
            }
        }
    }
    return std::nullopt;
}

std::optional<ProcfsCapabilityProbe::Accelerator> ProcfsCapabilityProbe::find_amd() const {
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(fs::path(sys_root_) / "class/drm", ec)) {
        auto name = entry.path().filename().string();
        // card0 is the device, card0-DP-1 etc. are its connectors
        if (!name.starts_with("card") || name.find('-') != std::string::npos) continue;

        auto device = entry.path() / "device";
        if (trim(read_first_line(device / "vendor")) != "0x1002") continue;

        Accelerator accel;
        accel.name = trim(read_first_line(device / "product_name"));
        if (accel.name.empty()) accel.name = "AMD GPU";

        std::istringstream vram(read_first_line(device / "mem_info_vram_total"));
        uint64_t bytes = 0;
        if (vram >> bytes) accel.memory_gb = static_cast<double>(bytes) / 1e9;
        return accel;
    }
    return std::nullopt;
}
