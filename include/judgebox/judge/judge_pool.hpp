#pragma once

#include <judgebox/common/class_traits.hpp>
#include <judgebox/judge/judge_engine.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/sandbox/execution_backend.hpp>
#include <judgebox/sandbox/sandbox_config.hpp>
#include <judgebox/sandbox/submission.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace judgebox {

/// Judges independent submissions concurrently on a fixed set of worker threads.
///
/// Each job is judged by a fresh JudgeEngine on the worker that picked it up, so concurrent
/// judgments share nothing but the (immutable) configuration.
class JudgePool : NonMovable
{
public:
    explicit JudgePool(std::size_t num_workers, JudgeConfig config = {}, SandboxConfig sandbox_config = {},
                       BackendFactory backend_factory = {});

    /// Calls ``shutdown``
    ~JudgePool();

    /// After ``shutdown`` the returned future is immediately ready with an InternalError verdict
    std::future<Verdict> submit(Submission submission, std::string expected);

    /// Stops every worker. Running candidates are killed and queued jobs are not started;
    /// both resolve to InternalError with the message "shutdown". Idempotent.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

    static constexpr std::string_view SHUTDOWN_MESSAGE = "shutdown";

private:
    struct Job
    {
        Submission submission;
        std::string expected;
        std::promise<Verdict> promise;
    };

    void worker_loop(std::stop_token stop_token);

    const JudgeConfig config_;
    const SandboxConfig sandbox_config_;
    const BackendFactory backend_factory_;

    std::mutex mutex_;
    std::condition_variable_any queue_cv_;
    std::deque<Job> queue_;
    bool closed_ = false;

    // Last, so that workers are started after (and joined before) everything they touch
    std::vector<std::jthread> workers_;
};

} // namespace judgebox
