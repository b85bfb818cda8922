#include <judgebox/judge/judge_engine.hpp>

#include <judgebox/common/error_types.hpp>
#include <judgebox/judge/checker.hpp>
#include <judgebox/judge/outcome_classifier.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/submission.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace judgebox {

JudgeEngine::JudgeEngine(JudgeConfig config, SandboxConfig sandbox_config, BackendFactory backend_factory)
    : config_{std::move(config)}
    , runner_{std::move(sandbox_config), std::move(backend_factory)}
    , checker_{to_check_fn(make_checker(config_.checker_kind, config_.checker_options))} {}

Verdict JudgeEngine::judge(const Submission& submission, std::string_view expected,
                           std::stop_token stop_token) const {
    return judge(submission, expected, checker_, std::move(stop_token));
}

Verdict JudgeEngine::judge(const Submission& submission, std::string_view expected, const CheckFn& checker,
                           std::stop_token stop_token) const {
    if (stop_token.stop_requested()) {
        return Verdict::make_internal_error("cancelled before the run started");
    }

    auto result = run_with_retries(submission, stop_token);

    if (!result) {
        LOG_ERROR("Judging {} failed: {}", submission.executable, result.error());
        return Verdict::make_internal_error(fmt::format("infrastructure failure: {}", result.error()));
    }

    Verdict verdict = classify(*result, expected, checker);

    LOG_INFO("{}: {:?}", submission.executable, verdict);

    return verdict;
}

Verdict JudgeEngine::judge(const std::filesystem::path& executable, std::string input,
                           std::chrono::milliseconds time_limit, std::uint64_t memory_limit, IoMode io_mode,
                           std::string_view expected, CheckerKind checker_kind) const {
    Submission submission{
        .executable = executable,
        .args = {},
        .input = std::move(input),
        .limits = {.time_limit = time_limit, .memory_limit = memory_limit},
        .io_mode = io_mode,
    };

    if (checker_kind == config_.checker_kind) {
        return judge(submission, expected);
    }

    return judge(submission, expected, to_check_fn(make_checker(checker_kind, config_.checker_options)));
}

Result<ExecutionResult> JudgeEngine::run_with_retries(const Submission& submission,
                                                      std::stop_token stop_token) const {
    for (int attempt = 1;; ++attempt) {
        auto result = runner_.run(submission, stop_token);

        if (result || result.error() != ErrorKind::SpawnFailure || attempt >= config_.max_attempts ||
            stop_token.stop_requested()) {
            return result;
        }

        LOG_WARN("Could not start {} (attempt {}/{}), retrying", submission.executable, attempt,
                 config_.max_attempts);

        std::this_thread::sleep_for(config_.retry_backoff * attempt);
    }
}

} // namespace judgebox
