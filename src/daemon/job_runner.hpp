#pragma once

#include "error.hpp"
#include "event_queue.hpp"
#include "whisper/backend.hpp"
#include "whisper/model_handle.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

enum class JobKind { ModelLoad, Transcribe };

std::string_view to_string(JobKind kind);

struct ModelLoadParams {
    ModelTier tier = ModelTier::Base;
    std::string device = "cpu";
};

struct TranscribeParams {
    std::string audio_path;
    TranscribeOptions options;
};

// The cancellation flag of a job is the stop token of the worker running it.
struct JobSpec {
    JobKind kind = JobKind::ModelLoad;
    std::variant<ModelLoadParams, TranscribeParams> params;
};

using JobOutput = std::variant<std::shared_ptr<ModelHandle>, TranscriptResult>;

struct JobHandle {
    uint64_t id = 0;

    bool operator==(const JobHandle&) const = default;
};

struct JobEvent {
    enum class Type { Progress, Completed, Failed, Cancelled };

    uint64_t job_id = 0;
    JobKind kind = JobKind::ModelLoad;
    Type type = Type::Progress;
    std::string message;              // Progress
    std::optional<JobOutput> output;  // Completed
    std::optional<Error> error;       // Failed

    bool is_terminal() const { return type != Type::Progress; }
};

// Runs one job at a time on its own worker thread. Each job produces zero or
// more Progress events followed by exactly one terminal event. Cancellation
// is cooperative: it is checked right before the task runs and right after
// it returns, so a blocking model call always finishes first.
//
// start/cancel/join/drain belong to the control thread.
class JobRunner {
public:
    using NotifyCallback = std::function<void()>;
    using ProgressFn = std::function<void(std::string)>;
    // Wraps exactly one blocking model call. May report progress before it.
    using Task = std::function<std::expected<JobOutput, Error>(const JobSpec&, const ProgressFn&)>;

    using StartHook = std::function<void()>;

    // notify runs on the worker after each event is queued. on_start runs on
    // the worker before the pre-task checkpoint.
    explicit JobRunner(NotifyCallback notify = {}, StartHook on_start = {});
    ~JobRunner();

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // Fails with AlreadyRunning while the previous job is non-terminal.
    std::expected<JobHandle, Error> start(JobSpec spec, Task task);

    // No-op for a job that is unknown or already terminal.
    void cancel(JobHandle handle);

    // Blocks until the job has emitted its terminal event.
    void join(JobHandle handle);

    bool busy() const;

    std::vector<JobEvent> drain() { return events_.drain(); }
    bool wait_for_events(std::chrono::milliseconds timeout) { return events_.wait(timeout); }

private:
    void run(std::stop_token stop, uint64_t id, JobSpec spec, Task task);
    void emit(JobEvent ev);

    NotifyCallback notify_;
    StartHook on_start_;
    EventQueue<JobEvent> events_;

    mutable std::mutex mu_;
    uint64_t next_id_ = 1;
    uint64_t current_id_ = 0;
    bool running_ = false;

    std::jthread worker_;
};
