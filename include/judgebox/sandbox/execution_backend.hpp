#pragma once

#include <judgebox/common/class_traits.hpp>
#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/resource_limits.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace judgebox {

/// Everything a backend needs to start the candidate
struct SpawnRequest
{
    std::filesystem::path executable;
    std::vector<std::string> args;

    /// Complete environment of the child, as ``KEY=VALUE`` strings
    std::vector<std::string> env;

    std::filesystem::path working_dir;

    /// Directory holding every run's workspace; nothing under it but ``working_dir`` is accessible
    std::filesystem::path sandbox_root;

    /// Opened read-only and used as the child's stdin
    std::filesystem::path stdin_path;
};

/// Parent-side read ends of the child's stdout and stderr (non-blocking).
/// Ownership passes to the caller of ``ExecutionBackend::spawn``.
struct ChildPipes
{
    int stdout_fd = -1;
    int stderr_fd = -1;
};

/// Termination info of the candidate, as reported by the backend
struct ChildExit
{
    ExitStatus status;
    std::chrono::milliseconds cpu_time{};
    std::uint64_t peak_memory = 0;
};

/// The process-isolation capabilities a SandboxRunner relies on.
///
/// A backend instance drives exactly one child. Calls are made from a single thread, in the order
/// ``install_limits`` -> ``spawn`` -> any number of ``wait_for`` / ``kill``.
class ExecutionBackend : NonCopyable
{
public:
    virtual ~ExecutionBackend() = default;

    /// Validate and stage the limits that ``spawn`` will apply before the candidate runs
    virtual Result<void> install_limits(const ResourceLimits& limits) = 0;

    virtual Result<ChildPipes> spawn(const SpawnRequest& request) = 0;

    /// Wait up to ``timeout`` for the child to terminate.
    /// nullopt if it is still running once ``timeout`` has elapsed.
    virtual Result<std::optional<ChildExit>> wait_for(std::chrono::milliseconds timeout) = 0;

    /// Forcibly terminate the child and everything it started
    virtual Result<void> kill() = 0;

    /// Whether the child asked for more address space than its limit allows
    virtual bool memory_limit_hit() const = 0;

    /// What the child was stopped from doing outside its confinement, if anything
    virtual std::optional<std::string> forbidden_access() const = 0;
};

using BackendFactory = std::function<std::unique_ptr<ExecutionBackend>()>;

} // namespace judgebox
