#include "controller.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

std::string_view to_string(ControllerState state) {
    switch (state) {
        case ControllerState::Idle: return "idle";
        case ControllerState::LoadingModel: return "loading_model";
        case ControllerState::ModelReady: return "model_ready";
        case ControllerState::Transcribing: return "transcribing";
    }
    return "unknown";
}

Controller::Controller(WhisperBackend& backend, HistoryStore& history,
                       const CapabilityProbe& probe, NotifyCallback notify)
    : backend_(backend), history_(history), probe_(probe), runner_(std::move(notify)) {}

CapabilityReport Controller::probe_capabilities() {
    capabilities_ = probe_.probe();
    return *capabilities_;
}

std::expected<JobHandle, Error> Controller::select_tier(ModelTier tier) {
    if (state_ == ControllerState::LoadingModel || state_ == ControllerState::Transcribing) {
        return std::unexpected(Error{ErrorKind::AlreadyRunning,
                                     std::format("cannot load {} while {}",
                                                 to_string(tier), to_string(state_))});
    }

    // Never keep two models alive: drop the current one before the next loads.
    model_.reset();

    JobSpec spec{
        .kind = JobKind::ModelLoad,
        .params = ModelLoadParams{.tier = tier, .device = device()},
    };

    auto handle = runner_.start(std::move(spec),
        [&backend = backend_](const JobSpec& s, const JobRunner::ProgressFn& progress)
            -> std::expected<JobOutput, Error> {
            const auto& p = std::get<ModelLoadParams>(s.params);
            progress(std::format("Loading {} model on {}...", to_string(p.tier), p.device));

            auto model = ModelHandle::load(backend, p.tier, p.device);
            if (!model) return std::unexpected(model.error());
            return JobOutput{std::move(*model)};
        });

    if (!handle) {
        state_ = ControllerState::Idle;
        return std::unexpected(handle.error());
    }

    requested_tier_ = tier;
    job_ = *handle;
    state_ = ControllerState::LoadingModel;
    return *handle;
}

std::expected<JobHandle, Error> Controller::reload_model() {
    auto tier = model_ ? std::optional<ModelTier>(model_->tier()) : requested_tier_;
    if (!tier) {
        return std::unexpected(Error{ErrorKind::NotReady, "no model has been selected"});
    }
    return select_tier(*tier);
}

std::expected<JobHandle, Error>
Controller::start_transcription(const std::string& audio_path, const TranscribeOptions& options) {
    if (state_ == ControllerState::Transcribing) {
        return std::unexpected(Error{ErrorKind::AlreadyRunning, "a transcription is in progress"});
    }
    if (state_ != ControllerState::ModelReady || !model_) {
        return std::unexpected(Error{ErrorKind::NotReady, std::string(to_string(state_))});
    }

    JobSpec spec{
        .kind = JobKind::Transcribe,
        .params = TranscribeParams{.audio_path = audio_path, .options = options},
    };

    auto handle = runner_.start(std::move(spec),
        [model = model_](const JobSpec& s, const JobRunner::ProgressFn& progress)
            -> std::expected<JobOutput, Error> {
            const auto& p = std::get<TranscribeParams>(s.params);
            progress("Starting transcription...");

            std::error_code ec;
            auto bytes = fs::file_size(p.audio_path, ec);
            if (!ec) {
                progress(std::format("Processing file ({:.1f} MB)...",
                                     static_cast<double>(bytes) / (1024.0 * 1024.0)));
            }

            auto result = model->transcribe(p.audio_path, p.options);
            if (!result) return std::unexpected(result.error());
            return JobOutput{std::move(*result)};
        });

    if (!handle) return std::unexpected(handle.error());

    job_ = *handle;
    state_ = ControllerState::Transcribing;
    return *handle;
}

bool Controller::cancel_current() {
    if (!job_) return false;
    runner_.cancel(*job_);
    return true;
}

std::vector<ControllerUpdate> Controller::process_events() {
    std::vector<ControllerUpdate> updates;
    for (auto& ev : runner_.drain()) {
        updates.push_back(apply(std::move(ev)));
    }
    return updates;
}

std::vector<ControllerUpdate> Controller::shutdown() {
    if (job_) {
        auto job = *job_;
        if (state_ == ControllerState::Transcribing) {
            runner_.cancel(job);
        }
        runner_.join(job);
    }
    return process_events();
}

std::optional<ModelTier> Controller::model_tier() const {
    if (!model_) return std::nullopt;
    return model_->tier();
}

ControllerUpdate Controller::apply(JobEvent ev) {
    ControllerUpdate update;

    if (ev.is_terminal()) {
        job_.reset();

        if (ev.kind == JobKind::ModelLoad) {
            auto* loaded = ev.output ? std::get_if<std::shared_ptr<ModelHandle>>(&*ev.output) : nullptr;
            if (ev.type == JobEvent::Type::Completed && loaded && *loaded) {
                model_ = std::move(*loaded);
                state_ = ControllerState::ModelReady;
                // The controller holds the only reference; callers use model_tier().
                ev.output.reset();
            } else {
                model_.reset();
                state_ = ControllerState::Idle;
            }
        } else {
            state_ = ControllerState::ModelReady;

            auto* result = ev.output ? std::get_if<TranscriptResult>(&*ev.output) : nullptr;
            if (ev.type == JobEvent::Type::Completed && result) {
                auto added = history_.add(*result);
                if (added) {
                    update.history_index = *added;
                } else {
                    std::println(stderr, "controller: {}", describe(added.error()));
                    update.history_index = history_.size() - 1;
                    update.persist_error = added.error();
                }

                // Hand back the stored copy so callers see created_at.
                if (auto entry = history_.get(*update.history_index)) {
                    *result = entry->result;
                }
            }
        }
    }

    update.state = state_;
    update.event = std::move(ev);
    return update;
}

std::string Controller::device() {
    if (!capabilities_) capabilities_ = probe_.probe();
    return std::string(to_string(capabilities_->device));
}
