#pragma once

#include "whisper/model_tier.hpp"

#include <string>
#include <string_view>

enum class ComputeDevice { Cpu, Accelerator };

inline std::string_view to_string(ComputeDevice device) {
    return device == ComputeDevice::Accelerator ? "accelerator" : "cpu";
}

struct CapabilityReport {
    ComputeDevice device = ComputeDevice::Cpu;
    std::string accelerator_name;
    double accelerator_memory_gb = 0.0;
    double available_ram_gb = 0.0;
    ModelTier recommended_tier = ModelTier::Base;
};

// Conservative pick so constrained hosts don't run out of memory.
// Large is never recommended.
inline ModelTier recommend_tier(double available_ram_gb) {
    if (available_ram_gb < 4.0) return ModelTier::Tiny;
    if (available_ram_gb < 8.0) return ModelTier::Base;
    if (available_ram_gb < 16.0) return ModelTier::Small;
    return ModelTier::Medium;
}

class CapabilityProbe {
public:
    virtual ~CapabilityProbe() = default;
    // Never fails; a host that can't be inspected gets a cpu/base report.
    virtual CapabilityReport probe() const = 0;
};
