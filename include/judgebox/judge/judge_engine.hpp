#pragma once

#include <judgebox/common/error_types.hpp>
#include <judgebox/judge/checker.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/sandbox/execution_backend.hpp>
#include <judgebox/sandbox/sandbox_config.hpp>
#include <judgebox/sandbox/sandbox_runner.hpp>
#include <judgebox/sandbox/submission.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <string_view>

namespace judgebox {

struct JudgeConfig
{
    static constexpr int DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr std::chrono::milliseconds DEFAULT_RETRY_BACKOFF{50};

    CheckerKind checker_kind = CheckerKind::Exact;
    CheckerOptions checker_options;

    /// Total number of tries for a run that failed to start. Candidate faults are never retried.
    int max_attempts = DEFAULT_MAX_ATTEMPTS;

    /// Sleep before retry n is ``n * retry_backoff``
    std::chrono::milliseconds retry_backoff = DEFAULT_RETRY_BACKOFF;
};

/// Runner -> classifier -> checker for one submission at a time
class JudgeEngine
{
public:
    explicit JudgeEngine(JudgeConfig config = {}, SandboxConfig sandbox_config = {},
                         BackendFactory backend_factory = {});

    /// Judge with the configured checker
    Verdict judge(const Submission& submission, std::string_view expected, std::stop_token stop_token = {}) const;

    /// Judge with an arbitrary check function in place of the configured checker
    Verdict judge(const Submission& submission, std::string_view expected, const CheckFn& checker,
                  std::stop_token stop_token = {}) const;

    /// Convenience form for callers that do not build Submissions themselves.
    /// Other limits keep their defaults; checker parameters come from the engine's config.
    Verdict judge(const std::filesystem::path& executable, std::string input, std::chrono::milliseconds time_limit,
                  std::uint64_t memory_limit, IoMode io_mode, std::string_view expected,
                  CheckerKind checker_kind) const;

    const JudgeConfig& get_config() const { return config_; }

private:
    /// Run, retrying only failures to spawn
    Result<ExecutionResult> run_with_retries(const Submission& submission, std::stop_token stop_token) const;

    JudgeConfig config_;
    SandboxRunner runner_;
    CheckFn checker_;
};

} // namespace judgebox
