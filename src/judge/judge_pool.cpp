#include <judgebox/judge/judge_pool.hpp>

#include <judgebox/judge/judge_engine.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/logging.hpp>

#include <libassert/assert.hpp>

#include <cstddef>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>

namespace judgebox {

JudgePool::JudgePool(std::size_t num_workers, JudgeConfig config, SandboxConfig sandbox_config,
                     BackendFactory backend_factory)
    : config_{std::move(config)}
    , sandbox_config_{std::move(sandbox_config)}
    , backend_factory_{std::move(backend_factory)} {
    ASSERT(num_workers > 0);

    workers_.reserve(num_workers);

    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop_token) { worker_loop(std::move(stop_token)); });
    }

    LOG_DEBUG("Started judge pool with {} worker(s)", num_workers);
}

JudgePool::~JudgePool() {
    shutdown();
}

std::future<Verdict> JudgePool::submit(Submission submission, std::string expected) {
    Job job{.submission = std::move(submission), .expected = std::move(expected), .promise = {}};
    std::future<Verdict> future = job.promise.get_future();

    {
        std::scoped_lock lock{mutex_};

        if (!closed_) {
            queue_.push_back(std::move(job));
            queue_cv_.notify_one();
            return future;
        }
    }

    job.promise.set_value(Verdict::make_internal_error(std::string{SHUTDOWN_MESSAGE}));

    return future;
}

void JudgePool::shutdown() {
    {
        std::scoped_lock lock{mutex_};
        closed_ = true;
    }

    for (auto& worker : workers_) {
        worker.request_stop();
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::deque<Job> abandoned;

    {
        std::scoped_lock lock{mutex_};
        abandoned.swap(queue_);
    }

    if (!abandoned.empty()) {
        LOG_WARN("Judge pool shut down with {} job(s) still queued", abandoned.size());
    }

    for (Job& job : abandoned) {
        job.promise.set_value(Verdict::make_internal_error(std::string{SHUTDOWN_MESSAGE}));
    }
}

void JudgePool::worker_loop(std::stop_token stop_token) {
    while (true) {
        std::unique_lock lock{mutex_};

        // Left in the queue on stop; shutdown() resolves them
        if (!queue_cv_.wait(lock, stop_token, [this] { return !queue_.empty(); }) || stop_token.stop_requested()) {
            return;
        }

        Job job = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        try {
            JudgeEngine engine{config_, sandbox_config_, backend_factory_};
            Verdict verdict = engine.judge(job.submission, job.expected, stop_token);

            if (stop_token.stop_requested() && verdict.kind == VerdictKind::InternalError) {
                verdict.message = std::string{SHUTDOWN_MESSAGE};
            }

            job.promise.set_value(std::move(verdict));
        } catch (const std::exception& ex) {
            LOG_ERROR("Judging {} threw: {}", job.submission.executable, ex);
            job.promise.set_exception(std::current_exception());
        }
    }
}

} // namespace judgebox
