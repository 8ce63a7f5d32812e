#include "model_handle.hpp"

#include <filesystem>

namespace fs = std::filesystem;

ModelHandle::ModelHandle(Key, ModelTier tier, std::string device, std::unique_ptr<WhisperModel> model)
    : tier_(tier), device_(std::move(device)), model_(std::move(model)) {}

std::expected<std::shared_ptr<ModelHandle>, Error>
ModelHandle::load(WhisperBackend& backend, ModelTier tier, const std::string& device) {
    auto model = backend.load_model(tier, device);
    if (!model) {
        return std::unexpected(Error{ErrorKind::LoadFailed, model.error()});
    }
    if (!*model) {
        return std::unexpected(Error{ErrorKind::LoadFailed, "backend returned no model"});
    }
    return std::make_shared<ModelHandle>(Key{}, tier, device, std::move(*model));
}

std::expected<TranscriptResult, Error>
ModelHandle::transcribe(const std::string& audio_path, const TranscribeOptions& options) {
    std::error_code ec;
    if (!fs::exists(audio_path, ec)) {
        return std::unexpected(Error{ErrorKind::FileNotFound, audio_path});
    }

    auto result = model_->transcribe(audio_path, options);
    if (!result) {
        return std::unexpected(Error{ErrorKind::TranscribeFailed, result.error()});
    }

    auto& tr = result.value();
    auto first = tr.text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        tr.text.clear();
    } else {
        tr.text = tr.text.substr(first, tr.text.find_last_not_of(" \t\n\r") - first + 1);
    }

    if (tr.language.empty()) {
        bool forced = !options.auto_detect_language && !options.forced_language.empty();
        tr.language = forced ? options.forced_language : "unknown";
    }

    tr.source_path = audio_path;
    tr.source_name = fs::path(audio_path).filename().string();
    tr.created_at = {};
    return std::move(tr);
}
