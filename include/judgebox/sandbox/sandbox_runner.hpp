#pragma once

#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/execution_backend.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/sandbox_config.hpp>
#include <judgebox/sandbox/submission.hpp>

#include <stop_token>
#include <string>
#include <vector>

namespace judgebox {

/// Runs one submission in a fresh workspace and supervises it to termination
///
/// Holds no per-run state: every ``run`` creates its own workspace and backend, so one runner
/// may serve consecutive runs (but is not meant to be shared across threads).
class SandboxRunner
{
public:
    /// With no factory, runs go through a ``PosixBackend``
    explicit SandboxRunner(SandboxConfig config = {}, BackendFactory backend_factory = {});

    /// Blocks until the program has terminated (on its own, through a limit, or because a stop
    /// was requested on ``stop_token``) and its output has been collected.
    ///
    /// Errors are infrastructure failures only; anything the program does is described by the result.
    Result<ExecutionResult> run(const Submission& submission, std::stop_token stop_token = {}) const;

    const SandboxConfig& get_config() const { return config_; }

    /// The complete environment candidates run with
    static const std::vector<std::string>& child_environment();

    static constexpr std::string_view STDIN_FILE_NAME = ".stdin";

private:
    SandboxConfig config_;
    BackendFactory backend_factory_;
};

} // namespace judgebox
