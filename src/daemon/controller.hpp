#pragma once

#include "error.hpp"
#include "job_runner.hpp"
#include "platform/capability_probe.hpp"
#include "storage/history_store.hpp"
#include "whisper/backend.hpp"
#include "whisper/model_handle.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class ControllerState { Idle, LoadingModel, ModelReady, Transcribing };

std::string_view to_string(ControllerState state);

// One processed job event and what it did to the controller.
struct ControllerUpdate {
    JobEvent event;
    ControllerState state = ControllerState::Idle;  // after the event was applied
    std::optional<size_t> history_index;            // transcript stored at this index
    std::optional<Error> persist_error;             // stored in memory but not on disk
};

// Owns the model, dispatches jobs and routes finished transcripts into the
// history. Every method is called from the control thread; job events come
// back through process_events().
class Controller {
public:
    using NotifyCallback = JobRunner::NotifyCallback;

    // notify is invoked from worker threads whenever events are waiting.
    Controller(WhisperBackend& backend, HistoryStore& history,
               const CapabilityProbe& probe, NotifyCallback notify = {});

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    CapabilityReport probe_capabilities();

    // Idle/ModelReady -> LoadingModel. The current model is discarded first.
    std::expected<JobHandle, Error> select_tier(ModelTier tier);
    std::expected<JobHandle, Error> reload_model();

    // ModelReady -> Transcribing.
    std::expected<JobHandle, Error>
        start_transcription(const std::string& audio_path, const TranscribeOptions& options);

    // The state only changes once the job reports Cancelled.
    bool cancel_current();

    std::vector<ControllerUpdate> process_events();
    bool wait_for_events(std::chrono::milliseconds timeout) {
        return runner_.wait_for_events(timeout);
    }

    // Cancels a running transcription, waits for any job and applies its
    // remaining events, which are returned.
    std::vector<ControllerUpdate> shutdown();

    ControllerState state() const { return state_; }
    std::optional<ModelTier> model_tier() const;
    std::optional<ModelTier> requested_tier() const { return requested_tier_; }
    std::optional<JobHandle> current_job() const { return job_; }

    std::vector<HistoryEntry> list_history() const { return history_.list(); }
    std::optional<HistoryEntry> history_entry(size_t index) const { return history_.get(index); }
    std::expected<bool, Error> remove_history_entry(size_t index) { return history_.remove(index); }
    std::expected<void, Error> export_history_entry(size_t index, const std::string& path) const {
        return history_.export_entry(index, path);
    }
    std::expected<void, Error> clear_history() { return history_.clear(); }

private:
    ControllerUpdate apply(JobEvent ev);
    std::string device();

    WhisperBackend& backend_;
    HistoryStore& history_;
    const CapabilityProbe& probe_;

    ControllerState state_ = ControllerState::Idle;
    std::shared_ptr<ModelHandle> model_;
    std::optional<ModelTier> requested_tier_;
    std::optional<JobHandle> job_;
    std::optional<CapabilityReport> capabilities_;

    JobRunner runner_;
};
