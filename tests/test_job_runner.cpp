#include <catch2/catch.hpp>

#include "job_runner.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std::chrono_literals;

namespace {

JobSpec transcribe_spec() {
    return JobSpec{
        .kind = JobKind::Transcribe,
        .params = TranscribeParams{.audio_path = "/tmp/scribe_test.wav"},
    };
}

JobSpec load_spec() {
    return JobSpec{
        .kind = JobKind::ModelLoad,
        .params = ModelLoadParams{.tier = ModelTier::Tiny},
    };
}

JobOutput transcript(const std::string& text) {
    TranscriptResult r;
    r.text = text;
    r.language = "en";
    return r;
}

// Task that blocks until the gate opens, then returns a transcript.
JobRunner::Task gated_task(std::shared_future<void> gate) {
    return [gate](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
        gate.wait();
        return transcript("late");
    };
}

size_t count_terminal(const std::vector<JobEvent>& events) {
    size_t n = 0;
    for (auto& ev : events) {
        if (ev.is_terminal()) ++n;
    }
    return n;
}

} // namespace

TEST_CASE("JobRunner", "[job_runner]") {
    std::atomic<int> notified{0};
    JobRunner runner([&notified] { ++notified; });

    SECTION("ProgressThenCompleted") {
        auto handle = runner.start(transcribe_spec(),
            [](const JobSpec& spec, const JobRunner::ProgressFn& progress)
                -> std::expected<JobOutput, Error> {
                progress("first");
                progress("second");
                return transcript(std::get<TranscribeParams>(spec.params).audio_path);
            });
        REQUIRE(handle);

        runner.join(*handle);
        auto events = runner.drain();

        REQUIRE(events.size() == 3);
        REQUIRE(events[0].type == JobEvent::Type::Progress);
        REQUIRE(events[0].message == "first");
        REQUIRE(events[1].type == JobEvent::Type::Progress);
        REQUIRE(events[1].message == "second");
        REQUIRE(events[2].type == JobEvent::Type::Completed);
        REQUIRE(events[2].output.has_value());
        REQUIRE(std::get<TranscriptResult>(*events[2].output).text == "/tmp/scribe_test.wav");

        for (auto& ev : events) {
            REQUIRE(ev.job_id == handle->id);
            REQUIRE(ev.kind == JobKind::Transcribe);
        }
        REQUIRE(notified == 3);
        REQUIRE_FALSE(runner.busy());
    }

    SECTION("ErrorBecomesFailed") {
        auto handle = runner.start(transcribe_spec(),
            [](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
                return std::unexpected(Error{ErrorKind::TranscribeFailed, "bad audio"});
            });
        REQUIRE(handle);
        runner.join(*handle);

        auto events = runner.drain();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == JobEvent::Type::Failed);
        REQUIRE(events[0].error.has_value());
        REQUIRE(events[0].error->kind == ErrorKind::TranscribeFailed);
        REQUIRE(events[0].error->detail == "bad audio");
        REQUIRE_FALSE(events[0].output.has_value());
    }

    SECTION("ExceptionBecomesFailed") {
        auto handle = runner.start(load_spec(),
            [](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
                throw std::runtime_error("out of memory");
            });
        REQUIRE(handle);
        runner.join(*handle);

        auto events = runner.drain();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == JobEvent::Type::Failed);
        REQUIRE(events[0].error->kind == ErrorKind::LoadFailed);
        REQUIRE(events[0].error->detail == "out of memory");
    }

    SECTION("SecondStartIsRejectedWhileRunning") {
        std::promise<void> gate;
        auto first = runner.start(transcribe_spec(), gated_task(gate.get_future().share()));
        REQUIRE(first);

        auto second = runner.start(load_spec(), gated_task(std::shared_future<void>{}));
        bool busy_while_gated = runner.busy();
        gate.set_value();

        REQUIRE(busy_while_gated);
        REQUIRE_FALSE(second);
        REQUIRE(second.error().kind == ErrorKind::AlreadyRunning);

        runner.join(*first);
        auto events = runner.drain();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].job_id == first->id);
        REQUIRE(events[0].type == JobEvent::Type::Completed);
        REQUIRE(std::get<TranscriptResult>(*events[0].output).text == "late");

        // Once the first job is terminal a new one can start
        auto third = runner.start(transcribe_spec(),
            [](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
                return transcript("again");
            });
        REQUIRE(third);
        REQUIRE(third->id > first->id);
        runner.join(*third);
        REQUIRE(runner.drain().size() == 1);
    }

    SECTION("CancelDuringCallYieldsSingleCancelled") {
        std::promise<void> gate;
        auto handle = runner.start(transcribe_spec(), gated_task(gate.get_future().share()));
        REQUIRE(handle);

        runner.cancel(*handle);
        gate.set_value();
        runner.join(*handle);

        auto events = runner.drain();
        REQUIRE(count_terminal(events) == 1);
        REQUIRE(events.back().type == JobEvent::Type::Cancelled);
        REQUIRE_FALSE(events.back().output.has_value());
    }

    SECTION("CancelBeforeStartSkipsTask") {
        std::promise<void> gate;
        auto future = gate.get_future().share();
        JobRunner gated([&notified] { ++notified; }, [future] { future.wait(); });

        std::atomic<int> invocations{0};
        auto handle = gated.start(transcribe_spec(),
            [&invocations](const JobSpec&, const JobRunner::ProgressFn&)
                -> std::expected<JobOutput, Error> {
                ++invocations;
                return transcript("never");
            });
        REQUIRE(handle);

        gated.cancel(*handle);
        gate.set_value();
        gated.join(*handle);

        auto events = gated.drain();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == JobEvent::Type::Cancelled);
        REQUIRE(invocations == 0);
        REQUIRE_FALSE(gated.busy());
    }

    SECTION("CancelWinsOverFailure") {
        std::promise<void> gate;
        auto future = gate.get_future().share();
        auto handle = runner.start(transcribe_spec(),
            [future](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
                future.wait();
                return std::unexpected(Error{ErrorKind::TranscribeFailed, "server went away"});
            });
        REQUIRE(handle);

        runner.cancel(*handle);
        gate.set_value();
        runner.join(*handle);

        auto events = runner.drain();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == JobEvent::Type::Cancelled);
    }

    SECTION("CancelAfterTerminalIsNoop") {
        auto handle = runner.start(transcribe_spec(),
            [](const JobSpec&, const JobRunner::ProgressFn&) -> std::expected<JobOutput, Error> {
                return transcript("done");
            });
        REQUIRE(handle);
        runner.join(*handle);
        REQUIRE(runner.drain().size() == 1);

        runner.cancel(*handle);
        runner.cancel(JobHandle{999});
        REQUIRE(runner.drain().empty());
        REQUIRE_FALSE(runner.busy());
    }

    SECTION("JobsStayInOrder") {
        std::vector<uint64_t> ids;
        for (int i = 0; i < 3; ++i) {
            auto handle = runner.start(transcribe_spec(),
                [i](const JobSpec&, const JobRunner::ProgressFn& progress)
                    -> std::expected<JobOutput, Error> {
                    progress("job " + std::to_string(i));
                    return transcript(std::to_string(i));
                });
            REQUIRE(handle);
            ids.push_back(handle->id);
            runner.join(*handle);
        }

        auto events = runner.drain();
        REQUIRE(events.size() == 6);
        for (size_t i = 0; i < 3; ++i) {
            REQUIRE(events[2 * i].job_id == ids[i]);
            REQUIRE(events[2 * i].type == JobEvent::Type::Progress);
            REQUIRE(events[2 * i + 1].job_id == ids[i]);
            REQUIRE(events[2 * i + 1].is_terminal());
        }
    }

    SECTION("WaitForEvents") {
        REQUIRE_FALSE(runner.wait_for_events(5ms));

        auto handle = runner.start(load_spec(),
            [](const JobSpec&, const JobRunner::ProgressFn& progress) -> std::expected<JobOutput, Error> {
                progress("loading");
                return std::unexpected(Error{ErrorKind::LoadFailed, "missing weights"});
            });
        REQUIRE(handle);
        REQUIRE(runner.wait_for_events(2000ms));
        runner.join(*handle);
        REQUIRE(runner.drain().size() == 2);
    }
}
