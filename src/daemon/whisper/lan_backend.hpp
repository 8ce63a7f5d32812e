#pragma once

#include "backend.hpp"

#include <string>

// Talks to a whisper.cpp server on the local network.
class LanBackend : public WhisperBackend {
public:
    // models_dir is a path on the server host holding ggml-<tier>.bin files.
    LanBackend(std::string url, std::string models_dir, long timeout_s = 600);
    ~LanBackend() override;

    LanBackend(const LanBackend&) = delete;
    LanBackend& operator=(const LanBackend&) = delete;

    std::expected<std::unique_ptr<WhisperModel>, std::string>
        load_model(ModelTier tier, const std::string& device) override;

private:
    std::string url_;
    std::string models_dir_;
    long timeout_s_;
};

class LanModel : public WhisperModel {
public:
    LanModel(std::string url, long timeout_s);

    std::expected<TranscriptResult, std::string>
        transcribe(const std::string& audio_path, const TranscribeOptions& options) override;

private:
    std::string url_;
    long timeout_s_;
};

// Parses the body of a /inference reply (json or verbose_json format).
// Language is left empty when the server does not report one.
std::expected<TranscriptResult, std::string> parse_inference_response(const std::string& body);
