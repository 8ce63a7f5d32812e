#include "job_runner.hpp"

#include <exception>
#include <format>

namespace {

ErrorKind failure_kind(JobKind kind) {
    return kind == JobKind::ModelLoad ? ErrorKind::LoadFailed : ErrorKind::TranscribeFailed;
}

} // namespace

std::string_view to_string(JobKind kind) {
    return kind == JobKind::ModelLoad ? "load" : "transcribe";
}

JobRunner::JobRunner(NotifyCallback notify, StartHook on_start)
    : notify_(std::move(notify)), on_start_(std::move(on_start)) {}

JobRunner::~JobRunner() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

std::expected<JobHandle, Error> JobRunner::start(JobSpec spec, Task task) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (running_) {
            return std::unexpected(Error{ErrorKind::AlreadyRunning,
                                         std::format("job {} has not finished", current_id_)});
        }
        id = next_id_++;
        current_id_ = id;
        running_ = true;
    }

    // The previous worker already emitted its terminal event; it is only exiting.
    if (worker_.joinable()) {
        worker_.join();
    }

    worker_ = std::jthread([this, id, spec = std::move(spec), task = std::move(task)]
                           (std::stop_token stop) mutable {
        run(stop, id, std::move(spec), std::move(task));
    });

    return JobHandle{id};
}

void JobRunner::cancel(JobHandle handle) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_ || handle.id != current_id_) return;
    worker_.request_stop();
}

void JobRunner::join(JobHandle handle) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        // Older workers were joined when the next job started.
        if (handle.id != current_id_) return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool JobRunner::busy() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_;
}

void JobRunner::run(std::stop_token stop, uint64_t id, JobSpec spec, Task task) {
    const JobKind kind = spec.kind;
    auto finish = [&](JobEvent::Type type) {
        return JobEvent{.job_id = id, .kind = kind, .type = type};
    };

    if (on_start_) on_start_();

    if (stop.stop_requested()) {
        emit(finish(JobEvent::Type::Cancelled));
        return;
    }

    ProgressFn progress = [this, id, kind](std::string message) {
        emit(JobEvent{
            .job_id = id,
            .kind = kind,
            .type = JobEvent::Type::Progress,
            .message = std::move(message),
        });
    };

    std::expected<JobOutput, Error> result =
        std::unexpected(Error{failure_kind(kind), "job produced no result"});
    try {
        result = task(spec, progress);
    } catch (const std::exception& e) {
        result = std::unexpected(Error{failure_kind(kind), e.what()});
    } catch (...) {
        result = std::unexpected(Error{failure_kind(kind), "unknown exception"});
    }

    // A result that arrives after cancel was requested is discarded, and
    // released before Cancelled becomes visible.
    if (stop.stop_requested()) {
        { auto discarded = std::move(result); }
        emit(finish(JobEvent::Type::Cancelled));
        return;
    }

    if (!result) {
        auto ev = finish(JobEvent::Type::Failed);
        ev.error = std::move(result.error());
        emit(std::move(ev));
        return;
    }

    auto ev = finish(JobEvent::Type::Completed);
    ev.output = std::move(result.value());
    emit(std::move(ev));
}

void JobRunner::emit(JobEvent ev) {
    if (ev.is_terminal()) {
        std::lock_guard<std::mutex> lock(mu_);
        running_ = false;
        events_.push(std::move(ev));
    } else {
        events_.push(std::move(ev));
    }

    if (notify_) notify_();
}
