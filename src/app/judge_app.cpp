#include "app/judge_app.hpp"

#include <judgebox/common/linux.hpp>
#include <judgebox/judge/judge_pool.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/submission.hpp>

#include "output/plaintext_serializer.hpp"
#include "output/serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/batch_manifest.hpp"
#include "user/program_options.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <string>
#include <utility>
#include <vector>

namespace judgebox {

namespace {

volatile std::sig_atomic_t interrupted = 0;

void on_interrupt(int /*signal_num*/) {
    interrupted = 1;
}

constexpr std::chrono::milliseconds INTERRUPT_POLL_PERIOD{50};

} // namespace

Expected<std::vector<JudgeApp::Job>, std::string> JudgeApp::load_jobs() const {
    std::vector<Job> jobs;

    if (!OPTS.is_batch()) {
        std::string input;

        if (OPTS.input_file) {
            auto contents = read_text_file(*OPTS.input_file);
            if (!contents) {
                return fmt::format("could not read input '{}': {}", *OPTS.input_file, contents.error());
            }
            input = std::move(*contents);
        }

        auto expected = read_text_file(*OPTS.expected_file);
        if (!expected) {
            return fmt::format("could not read expected answer '{}': {}", *OPTS.expected_file, expected.error());
        }

        jobs.push_back(Job{.name = OPTS.executable.string(),
                           .submission = {.executable = OPTS.executable,
                                          .args = OPTS.args,
                                          .input = std::move(input),
                                          .limits = OPTS.limits,
                                          .io_mode = OPTS.io_mode},
                           .expected = std::move(*expected)});

        return jobs;
    }

    auto entries = read_batch_manifest(*OPTS.batch_file);

    if (!entries) {
        return entries.error();
    }

    for (BatchEntry& entry : *entries) {
        auto input = read_text_file(entry.input_file);
        if (!input) {
            return fmt::format("{}: could not read input '{}': {}", entry.name, entry.input_file, input.error());
        }

        auto expected = read_text_file(entry.expected_file);
        if (!expected) {
            return fmt::format("{}: could not read expected answer '{}': {}", entry.name, entry.expected_file,
                               expected.error());
        }

        jobs.push_back(Job{.name = std::move(entry.name),
                           .submission = {.executable = std::move(entry.executable),
                                          .args = {},
                                          .input = std::move(*input),
                                          .limits = OPTS.limits,
                                          .io_mode = OPTS.io_mode},
                           .expected = std::move(*expected)});
    }

    return jobs;
}

int JudgeApp::run_impl() {
    StdoutSink output_sink;
    PlainTextSerializer serializer{output_sink, OPTS.colorize_option, OPTS.verbosity, OPTS.is_batch()};

    auto jobs = load_jobs();

    if (!jobs) {
        serializer.on_error(jobs.error());
        serializer.finalize();
        return EXIT_FAILURE;
    }

    for (int sig : {SIGINT, SIGTERM}) {
        if (auto res = linux::sigaction(sig, on_interrupt); !res) {
            LOG_WARN("Could not install handler for {}: {}", linux::Signal{sig}, res.error());
        }
    }

    const auto start = std::chrono::steady_clock::now();
    const std::size_t num_workers = std::clamp<std::size_t>(OPTS.jobs, 1, jobs->size());

    JudgePool pool{num_workers, OPTS.judge_config(), OPTS.sandbox_config()};

    std::vector<std::future<Verdict>> futures;
    futures.reserve(jobs->size());

    for (Job& job : *jobs) {
        futures.push_back(pool.submit(std::move(job.submission), std::move(job.expected)));
    }

    std::vector<JudgedSubmission> results;
    results.reserve(futures.size());
    bool shut_down = false;

    for (std::size_t i = 0; i < futures.size(); ++i) {
        while (futures[i].wait_for(INTERRUPT_POLL_PERIOD) != std::future_status::ready) {
            if (interrupted != 0 && !shut_down) {
                serializer.on_warning("Interrupted; stopping all runs");
                pool.shutdown();
                shut_down = true;
            }
        }

        results.push_back(JudgedSubmission{.name = std::move((*jobs)[i].name), .verdict = futures[i].get()});
        serializer.on_verdict(results.back());
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    serializer.on_summary(results, elapsed);
    serializer.finalize();

    const auto num_failed =
        ranges::count_if(results, [](const JudgedSubmission& res) { return !res.verdict.is_correct(); });

    return static_cast<int>(std::min<std::ptrdiff_t>(num_failed, MAX_EXIT_CODE));
}

} // namespace judgebox
