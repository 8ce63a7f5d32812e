#pragma once

#include "platform/capability_probe.hpp"

#include <optional>
#include <string>

class ProcfsCapabilityProbe : public CapabilityProbe {
public:
    explicit ProcfsCapabilityProbe(std::string proc_root = "/proc", std::string sys_root = "/sys");

    CapabilityReport probe() const override;

private:
    struct Accelerator {
        std::string name;
        double memory_gb = 0.0;
    };

    std::optional<double> read_available_ram_gb() const;
    std::optional<Accelerator> find_nvidia() const;
    std::optional<Accelerator> find_amd() const;

    std::string proc_root_;
    std::string sys_root_;
};
