#pragma once

#include <judgebox/common/class_traits.hpp>
#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/path_policy.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <linux/filter.h>
#include <sys/types.h>

namespace judgebox {

/// Supervises a traced process tree through seccomp and ptrace:
///   - address-space growth (mmap, mremap) is checked against the RLIMIT_AS ceiling, and the
///     first request the kernel would refuse is flagged as a memory limit hit;
///   - file syscalls are checked against a ``PathPolicy``, signals may only target the tree
///     itself, and cross-process memory access and io_uring are refused;
///   - the peak resident set size (VmHWM) of every task is sampled.
///
/// A request that hits the memory limit or breaks confinement is never let through: the task
/// is left stopped for the supervisor to kill.
///
/// Without the memory check, an allocation refused by RLIMIT_AS surfaces as whatever the program
/// does on allocation failure (usually SIGABRT or SIGSEGV), which is indistinguishable from a crash.
///
/// Protocol:
///   child:  PTRACE_TRACEME, raise(SIGSTOP), PR_SET_NO_NEW_PRIVS, PR_SET_SECCOMP(filter_program()), execve
///   parent: attach(), then on_stop() for every ptrace-stop that wait4(2) reports
///
/// All calls must be made from the thread that forked the child.
///
/// Paths are resolved from the tracer after the tracee has passed them in. A multithreaded
/// program that rewrites a path or swaps a symlink in between can get past the policy.
class SyscallWatch : NonMovable
{
public:
    SyscallWatch(std::uint64_t address_space_limit, PathPolicy policy);

    /// BPF program for PR_SET_SECCOMP. Valid for the lifetime of this object.
    const sock_fprog* filter_program() const { return &program_; }

    /// Wait for the child's initial SIGSTOP, set tracing options and run it up to its execve.
    ///
    /// Returns the wait(2) status if the child terminated before reaching execve (a setup failure
    /// it will have reported itself), nullopt once it is stopped at the exec event and resumed.
    Result<std::optional<int>> attach(pid_t pid);

    /// Handle one ptrace-stop reported for ``tid``, resuming it unless it made a request that is
    /// over the limit or not allowed
    Result<void> on_stop(pid_t tid, int status);

    /// ``tid`` terminated and will not be reported again
    void forget(pid_t tid) {
        tasks_.erase(tid);
        fresh_.erase(tid);
    }

    /// Record the current VmHWM of ``tid``; a no-op if it is already gone or has not exec'd yet
    void sample_peak(pid_t tid);

    bool limit_hit() const { return limit_hit_; }

    /// What the first refused request tried to do, if the tree broke confinement
    const std::optional<std::string>& violation() const { return violation_; }

    /// Highest resident set size sampled from any task, in bytes
    std::uint64_t peak_rss() const { return peak_rss_; }

    /// Every task currently known to be traced
    const std::set<pid_t>& tasks() const { return tasks_; }

private:
    struct SyscallRequest
    {
        long nr;
        std::array<std::uint64_t, 6> args;
    };

    /// One path argument of a file syscall
    struct PathOperand
    {
        int dirfd;
        std::uint64_t address;
        FileAccess access;

        /// Resolve a final symlink (open) or name the link itself (unlink, rename, ...)
        bool follow;
    };

    Result<void> on_seccomp_stop(pid_t tid);

    /// Pages by which ``request`` would grow the address space
    std::uint64_t growth_of(const SyscallRequest& request) const;

    /// Description of the first thing ``request`` is not allowed to do, if any
    std::optional<std::string> check_confinement(pid_t tid, const SyscallRequest& request) const;

    std::optional<std::string> check_paths(pid_t tid, const SyscallRequest& request) const;

    std::optional<std::string> check_signal_target(pid_t tid, const SyscallRequest& request) const;

    static std::vector<PathOperand> path_operands(pid_t tid, const SyscallRequest& request);

    /// Absolute, symlink-free form of a path as ``tid`` would see it; nullopt if it cannot be resolved
    static std::optional<std::filesystem::path> resolve(pid_t tid, const PathOperand& operand,
                                                        const std::string& raw);

    /// NUL-terminated string at ``address`` in the memory of ``tid``
    static std::optional<std::string> read_string(pid_t tid, std::uint64_t address);

    std::uint64_t to_pages(std::uint64_t bytes) const { return (bytes + page_size_ - 1) / page_size_; }

    /// Parse /proc/<tid>/syscall; valid while the task is in a seccomp-stop
    static std::optional<SyscallRequest> read_syscall(pid_t tid);

    /// Current virtual memory size of ``tid`` in pages, from /proc/<tid>/statm
    static std::optional<std::uint64_t> read_vm_pages(pid_t tid);

    static Result<void> resume(pid_t tid, int signal_num = 0);

    static std::vector<sock_filter> make_filter();

    std::uint64_t limit_;
    std::uint64_t page_size_;
    PathPolicy policy_;

    bool limit_hit_ = false;
    std::optional<std::string> violation_;
    std::uint64_t peak_rss_ = 0;
    bool exec_seen_ = false;

    /// The tracee that was spawned; its process group is the tree's
    pid_t root_ = -1;
    std::set<pid_t> tasks_;

    /// Auto-attached tasks whose initial SIGSTOP has not been seen yet
    std::set<pid_t> fresh_;

    std::vector<sock_filter> filter_;
    sock_fprog program_;
};

} // namespace judgebox
