#pragma once

#include "backend.hpp"
#include "error.hpp"

#include <expected>
#include <memory>
#include <string>

// A loaded model for one (tier, device) pair. Both operations block and are
// meant to run on a JobRunner worker.
class ModelHandle {
    struct Key {
        explicit Key() = default;
    };

public:
    // Only reachable through load(); Key is private.
    ModelHandle(Key, ModelTier tier, std::string device, std::unique_ptr<WhisperModel> model);

    static std::expected<std::shared_ptr<ModelHandle>, Error>
        load(WhisperBackend& backend, ModelTier tier, const std::string& device);

    ModelHandle(const ModelHandle&) = delete;
    ModelHandle& operator=(const ModelHandle&) = delete;

    // Fails with FileNotFound if audio_path does not exist at call time.
    // The returned result has provenance filled in and created_at unset.
    std::expected<TranscriptResult, Error>
        transcribe(const std::string& audio_path, const TranscribeOptions& options);

    ModelTier tier() const { return tier_; }
    const std::string& device() const { return device_; }

private:
    ModelTier tier_;
    std::string device_;
    std::unique_ptr<WhisperModel> model_;
};
