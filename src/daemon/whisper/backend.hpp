#pragma once

#include "whisper/model_tier.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <vector>

struct Segment {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    bool operator==(const Segment&) const = default;
};

struct TranscribeOptions {
    bool auto_detect_language = true;
    bool translate_to_english = false;
    std::string forced_language; // only used when auto_detect_language is false
};

struct TranscriptResult {
    std::string text;
    std::string language;
    std::vector<Segment> segments;
    std::string source_path;
    std::string source_name;
    // Zero until the result is accepted into history.
    std::chrono::system_clock::time_point created_at{};

    bool has_created_at() const { return created_at.time_since_epoch().count() != 0; }

    bool operator==(const TranscriptResult&) const = default;
};

// A model instance produced by a WhisperBackend. Blocking; call from a worker.
class WhisperModel {
public:
    virtual ~WhisperModel() = default;
    virtual std::expected<TranscriptResult, std::string>
        transcribe(const std::string& audio_path, const TranscribeOptions& options) = 0;
};

class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;
    virtual std::expected<std::unique_ptr<WhisperModel>, std::string>
        load_model(ModelTier tier, const std::string& device) = 0;
};
