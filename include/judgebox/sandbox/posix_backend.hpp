#pragma once

#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/execution_backend.hpp>
#include <judgebox/sandbox/resource_limits.hpp>
#include <judgebox/sandbox/syscall_watch.hpp>

#include <cstdint>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace judgebox {

/// Linux backend: fork/execve, setrlimit(2) in the child, a process group per run, and a
/// ``SyscallWatch`` over the whole process tree confining it to its working directory.
///
/// Every call, including destruction, must happen on the thread that called ``spawn``, as that
/// thread is the tracer and the only one allowed to reap the child.
class PosixBackend final : public ExecutionBackend
{
public:
    PosixBackend() = default;

    PosixBackend(PosixBackend&&) = delete;
    PosixBackend& operator=(PosixBackend&&) = delete;

    /// Kills and reaps the child if it is still around
    ~PosixBackend() override;

    Result<void> install_limits(const ResourceLimits& limits) override;
    Result<ChildPipes> spawn(const SpawnRequest& request) override;
    Result<std::optional<ChildExit>> wait_for(std::chrono::milliseconds timeout) override;
    Result<void> kill() override;

    bool memory_limit_hit() const override { return watch_ && watch_->limit_hit(); }

    std::optional<std::string> forbidden_access() const override {
        return watch_ ? watch_->violation() : std::nullopt;
    }

private:
    /// Handle every state change currently pending, without blocking
    Result<void> reap_pending();

    /// Kill whatever is left of the process tree once the candidate itself is gone
    void sweep();

    /// Read the setup failure the child reports before execve, if any
    Result<void> check_child_setup(int status_fd, std::optional<int> early_exit_status);

    std::optional<ResourceLimiter> limiter_;
    std::uint64_t address_space_limit_ = 0;
    std::optional<SyscallWatch> watch_;

    pid_t pid_ = -1;
    std::optional<ChildExit> exit_;

    /// The whole tree is gone; nothing may be signalled under ``pid_`` any more
    bool swept_ = false;

    static constexpr std::chrono::milliseconds REAP_POLL_PERIOD{1};
    static constexpr std::chrono::milliseconds SWEEP_TIMEOUT{200};
    static constexpr std::chrono::milliseconds DESTRUCTOR_REAP_TIMEOUT{2000};
};

} // namespace judgebox
