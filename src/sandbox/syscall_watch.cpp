#include <judgebox/sandbox/syscall_watch.hpp>

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/path_policy.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <csignal>
#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace judgebox {

namespace {

#if defined(__x86_64__)
constexpr std::uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr std::uint32_t NATIVE_AUDIT_ARCH = AUDIT_ARCH_AARCH64;
#else
#error "Unsupported architecture: only x86_64 and aarch64 are supported"
#endif

/// Stopped in the tracer on every call
const std::vector<long>& traced_syscalls() {
    static const std::vector<long> syscalls{
        SYS_mmap,
        SYS_mremap,
#ifdef SYS_open
        SYS_open,
#endif
#ifdef SYS_creat
        SYS_creat,
#endif
        SYS_openat,
#ifdef SYS_openat2
        SYS_openat2,
#endif
#ifdef SYS_truncate
        SYS_truncate,
#endif
#ifdef SYS_mkdir
        SYS_mkdir,
#endif
        SYS_mkdirat,
#ifdef SYS_mknod
        SYS_mknod,
#endif
        SYS_mknodat,
#ifdef SYS_unlink
        SYS_unlink,
#endif
#ifdef SYS_rmdir
        SYS_rmdir,
#endif
        SYS_unlinkat,
#ifdef SYS_rename
        SYS_rename,
#endif
#ifdef SYS_renameat
        SYS_renameat,
#endif
        SYS_renameat2,
#ifdef SYS_link
        SYS_link,
#endif
        SYS_linkat,
#ifdef SYS_symlink
        SYS_symlink,
#endif
        SYS_symlinkat,
#ifdef SYS_chmod
        SYS_chmod,
#endif
        SYS_fchmodat,
        SYS_kill,
        SYS_tkill,
        SYS_tgkill,
        SYS_rt_sigqueueinfo,
        SYS_rt_tgsigqueueinfo,
#ifdef SYS_pidfd_open
        SYS_pidfd_open,
#endif
    };

    return syscalls;
}

/// Fail with EPERM without involving the tracer
const std::vector<long>& refused_syscalls() {
    static const std::vector<long> syscalls{
        SYS_ptrace,
        SYS_process_vm_readv,
        SYS_process_vm_writev,
#ifdef SYS_io_uring_setup
        SYS_io_uring_setup,
#endif
    };

    return syscalls;
}

bool is_signal_syscall(long nr) {
    switch (nr) {
    case SYS_kill:
    case SYS_tkill:
    case SYS_tgkill:
    case SYS_rt_sigqueueinfo:
    case SYS_rt_tgsigqueueinfo:
#ifdef SYS_pidfd_open
    case SYS_pidfd_open:
#endif
        return true;
    default:
        return false;
    }
}

/// Whether a wait(2) status is the ptrace-stop for ``event`` (a PTRACE_EVENT_* value)
constexpr bool is_ptrace_event(int status, int event) {
    // see ptrace(2): status >> 8 == (SIGTRAP | (PTRACE_EVENT_foo << 8))
    return (status >> 8) == (SIGTRAP | (event << 8));
}

constexpr int ptrace_event_of(int status) {
    return status >> 16;
}

/// An int argument, which only occupies the low half of its register
constexpr int int_arg(std::uint64_t reg) {
    return static_cast<int>(static_cast<std::int32_t>(reg & 0xFFFF'FFFFU));
}

FileAccess open_access(std::uint64_t raw_flags) {
    const int flags = int_arg(raw_flags);

    if ((flags & O_ACCMODE) != O_RDONLY || (flags & (O_CREAT | O_TRUNC)) != 0) {
        return FileAccess::Write;
    }

    return FileAccess::Read;
}

std::string_view access_name(FileAccess access) {
    return access == FileAccess::Write ? "write" : "read";
}

constexpr std::size_t MAX_PATH_LENGTH = 4096;

} // namespace

SyscallWatch::SyscallWatch(std::uint64_t address_space_limit, PathPolicy policy)
    : limit_{address_space_limit}
    , page_size_{gsl::narrow_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE))}
    , policy_{std::move(policy)}
    , filter_{make_filter()}
    , program_{.len = gsl::narrow_cast<unsigned short>(filter_.size()), .filter = filter_.data()} {}

std::vector<sock_filter> SyscallWatch::make_filter() {
    // Other ABIs would get past every check below
    std::vector<sock_filter> filter{
        BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, arch)),
        BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, NATIVE_AUDIT_ARCH, 1, 0),
        BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS),
        BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(seccomp_data, nr)),
    };

#if defined(__x86_64__)
    // x32 calls share the x86_64 arch value and are told apart by this bit
    filter.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, __X32_SYSCALL_BIT, 0, 1));
    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
#endif

    auto add = [&filter](long nr, std::uint32_t action) {
        filter.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<std::uint32_t>(nr), 0, 1));
        filter.push_back(BPF_STMT(BPF_RET | BPF_K, action));
    };

    for (long nr : traced_syscalls()) {
        add(nr, SECCOMP_RET_TRACE);
    }

    for (long nr : refused_syscalls()) {
        add(nr, SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA));
    }

    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    return filter;
}

Result<std::optional<int>> SyscallWatch::attach(pid_t pid) {
    auto initial = TRYE(linux::wait4(pid, __WALL), SyscallFailure);
    ASSERT(initial.has_value(), "blocking wait4 returned without a state change");

    if (!WIFSTOPPED(initial->status)) {
        return std::optional{initial->status};
    }

    DEBUG_ASSERT(WSTOPSIG(initial->status) == SIGSTOP, "child must stop itself before execve", initial->status);

    // Options:
    //   kill every tracee if this thread goes away
    //   report seccomp SECCOMP_RET_TRACE, exec, exit and new tasks as ptrace events
    constexpr long OPTIONS = PTRACE_O_EXITKILL | PTRACE_O_TRACESECCOMP | PTRACE_O_TRACEEXEC | // NOLINT
                             PTRACE_O_TRACEEXIT | PTRACE_O_TRACECLONE | PTRACE_O_TRACEFORK | PTRACE_O_TRACEVFORK;

    TRYE(linux::ptrace(PTRACE_SETOPTIONS, pid, nullptr, OPTIONS), LimitSetupFailure);

    root_ = pid;
    tasks_.insert(pid);
    TRY(resume(pid));

    // Run up to the exec event. Anything that goes wrong before that is reported by the child itself.
    while (true) {
        auto stop = TRYE(linux::wait4(pid, __WALL), SyscallFailure);
        ASSERT(stop.has_value(), "blocking wait4 returned without a state change");

        if (!WIFSTOPPED(stop->status)) {
            forget(pid);
            return std::optional{stop->status};
        }

        if (is_ptrace_event(stop->status, PTRACE_EVENT_EXEC)) {
            LOG_TRACE("pid {} reached execve under trace", pid);
            exec_seen_ = true;
            TRY(resume(pid));
            return std::optional<int>{};
        }

        // Still the forked copy of this process; nothing to account for yet
        if (is_ptrace_event(stop->status, PTRACE_EVENT_EXIT)) {
            TRY(resume(pid));
            continue;
        }

        TRY(on_stop(pid, stop->status));
    }
}

Result<void> SyscallWatch::on_stop(pid_t tid, int status) {
    DEBUG_ASSERT(WIFSTOPPED(status));

    const int signal_num = WSTOPSIG(status);
    const int event = ptrace_event_of(status);

    if (!tasks_.contains(tid)) {
        tasks_.insert(tid);
        fresh_.insert(tid);
        LOG_TRACE("New traced task {}", tid);
    }

    // Tasks auto-attached through fork/clone begin with a SIGSTOP that the program never sent
    if (fresh_.erase(tid) > 0 && signal_num == SIGSTOP && event == 0) {
        return resume(tid);
    }

    if (is_ptrace_event(status, PTRACE_EVENT_SECCOMP)) {
        return on_seccomp_stop(tid);
    }

    if (is_ptrace_event(status, PTRACE_EVENT_EXIT)) {
        sample_peak(tid);
        return resume(tid);
    }

    if (is_ptrace_event(status, PTRACE_EVENT_FORK) || is_ptrace_event(status, PTRACE_EVENT_VFORK) ||
        is_ptrace_event(status, PTRACE_EVENT_CLONE)) {
        // Known from now on, so that the parent may signal it before its first stop is seen
        unsigned long new_tid = 0; // NOLINT(google-runtime-int)
        if (linux::ptrace(PTRACE_GETEVENTMSG, tid, nullptr, &new_tid)) {
            const auto child = static_cast<pid_t>(new_tid);
            if (tasks_.insert(child).second) {
                fresh_.insert(child);
            }
        }
        return resume(tid);
    }

    // exec and any other notification
    if (signal_num == SIGTRAP && event != 0) {
        return resume(tid);
    }

    // Either a signal-delivery-stop, where the signal must be passed on, or a group-stop,
    // where the task has to stay stopped. PTRACE_GETSIGINFO fails with EINVAL only for the latter.
    siginfo_t info{};
    auto siginfo_res = linux::ptrace(PTRACE_GETSIGINFO, tid, nullptr, &info);

    if (!siginfo_res && siginfo_res.error() == std::errc::invalid_argument) {
        LOG_DEBUG("Task {} entered group-stop ({}); leaving it stopped", tid, linux::Signal{signal_num});
        return {};
    }

    // The signal may be fatal
    sample_peak(tid);

    return resume(tid, signal_num);
}

Result<void> SyscallWatch::on_seccomp_stop(pid_t tid) {
    const auto request = read_syscall(tid);

    if (!request) {
        // Gone in the meantime; otherwise nothing unchecked may run
        if (!linux::kill(tid, 0)) {
            return {};
        }

        LOG_WARN("Could not inspect the system call of task {}", tid);
        violation_ = violation_.value_or("system call that could not be inspected");
        return {};
    }

    sample_peak(tid);

    if (request->nr == SYS_mmap || request->nr == SYS_mremap) {
        const auto vm_pages = read_vm_pages(tid);

        if (!vm_pages) {
            LOG_DEBUG("Could not read the address space size of task {}; letting the request through", tid);
            return resume(tid);
        }

        const std::uint64_t growth = growth_of(*request);
        const std::uint64_t limit_pages = limit_ / page_size_;

        // Same check the kernel makes against RLIMIT_AS (see may_expand_vm)
        if (*vm_pages + growth > limit_pages) {
            LOG_DEBUG("Task {} requested {} pages (syscall {}) with {} pages mapped; limit is {} pages", tid, growth,
                      request->nr, *vm_pages, limit_pages);
            limit_hit_ = true;
            return {};
        }

        return resume(tid);
    }

    if (auto violation = check_confinement(tid, *request)) {
        LOG_DEBUG("Task {} refused: {}", tid, *violation);

        if (!violation_) {
            violation_ = std::move(violation);
        }

        return {};
    }

    return resume(tid);
}

std::uint64_t SyscallWatch::growth_of(const SyscallRequest& request) const {
    switch (request.nr) {
    case SYS_mmap: {
        // mmap(addr, length, prot, flags, fd, offset)
        // MAP_FIXED may replace existing mappings; charge nothing rather than overestimate
        if ((request.args[3] & MAP_FIXED) != 0) {
            return 0;
        }
        return to_pages(request.args[1]);
    }
    case SYS_mremap: {
        // mremap(old_address, old_size, new_size, flags, ...)
        const std::uint64_t old_pages = to_pages(request.args[1]);
        const std::uint64_t new_pages = to_pages(request.args[2]);
        return new_pages > old_pages ? new_pages - old_pages : 0;
    }
    default:
        return 0;
    }
}

std::optional<std::string> SyscallWatch::check_confinement(pid_t tid, const SyscallRequest& request) const {
    if (is_signal_syscall(request.nr)) {
        return check_signal_target(tid, request);
    }

    return check_paths(tid, request);
}

std::optional<std::string> SyscallWatch::check_paths(pid_t tid, const SyscallRequest& request) const {
    for (const PathOperand& operand : path_operands(tid, request)) {
        auto raw = read_string(tid, operand.address);

        // The kernel fails the call with EFAULT
        if (!raw) {
            continue;
        }

        auto resolved = resolve(tid, operand, *raw);

        if (!resolved) {
            return fmt::format("{} access to unresolvable path '{}'", access_name(operand.access), *raw);
        }

        if (!policy_.allows(*resolved, operand.access)) {
            return fmt::format("{} access to '{}'", access_name(operand.access), resolved->string());
        }
    }

    return std::nullopt;
}

std::optional<std::string> SyscallWatch::check_signal_target(pid_t tid, const SyscallRequest& request) const {
    const pid_t target = int_arg(request.args[0]);
    bool allowed = false;

    switch (request.nr) {
    case SYS_kill:
        if (target > 0) {
            allowed = tasks_.contains(target);
        } else if (target == 0) {
            allowed = ::getpgid(tid) == root_;
        } else {
            // -1 is every process we may signal
            allowed = target != -1 && -target == root_;
        }
        break;
    case SYS_tgkill:
    case SYS_rt_tgsigqueueinfo:
        allowed = tasks_.contains(target) && tasks_.contains(int_arg(request.args[1]));
        break;
    default:
        allowed = target > 0 && tasks_.contains(target);
        break;
    }

    if (allowed) {
        return std::nullopt;
    }

    return fmt::format("signal to pid {} outside the sandbox (syscall {})", target, request.nr);
}

std::vector<SyscallWatch::PathOperand> SyscallWatch::path_operands(pid_t tid, const SyscallRequest& request) {
    const auto& args = request.args;

    constexpr auto WRITE = FileAccess::Write;
    const int dirfd0 = int_arg(args[0]);

    switch (request.nr) {
#ifdef SYS_open
    case SYS_open:
        return {{AT_FDCWD, args[0], open_access(args[1]), true}};
#endif
#ifdef SYS_creat
    case SYS_creat:
        return {{AT_FDCWD, args[0], WRITE, true}};
#endif
    case SYS_openat:
        return {{dirfd0, args[1], open_access(args[2]), true}};
#ifdef SYS_openat2
    case SYS_openat2: {
        // openat2(dirfd, path, struct open_how*, size); open_how starts with the u64 flags
        std::uint64_t flags = O_WRONLY;
        auto copied = linux::process_vm_readv(tid, args[2], &flags, sizeof(flags));

        if (!copied || copied.value() != sizeof(flags)) {
            flags = O_WRONLY;
        }

        return {{dirfd0, args[1], open_access(flags), true}};
    }
#endif
#ifdef SYS_truncate
    case SYS_truncate:
        return {{AT_FDCWD, args[0], WRITE, true}};
#endif
#ifdef SYS_chmod
    case SYS_chmod:
        return {{AT_FDCWD, args[0], WRITE, true}};
#endif
    case SYS_fchmodat:
        return {{dirfd0, args[1], WRITE, true}};
#ifdef SYS_mkdir
    case SYS_mkdir:
#endif
#ifdef SYS_mknod
    case SYS_mknod:
#endif
#ifdef SYS_unlink
    case SYS_unlink:
#endif
#ifdef SYS_rmdir
    case SYS_rmdir:
#endif
        return {{AT_FDCWD, args[0], WRITE, false}};
    case SYS_mkdirat:
    case SYS_mknodat:
    case SYS_unlinkat:
        return {{dirfd0, args[1], WRITE, false}};
#ifdef SYS_rename
    case SYS_rename:
#endif
#ifdef SYS_link
    case SYS_link:
#endif
        return {{AT_FDCWD, args[0], WRITE, false}, {AT_FDCWD, args[1], WRITE, false}};
#ifdef SYS_renameat
    case SYS_renameat:
#endif
    case SYS_renameat2:
    case SYS_linkat:
        return {{dirfd0, args[1], WRITE, false}, {int_arg(args[2]), args[3], WRITE, false}};
    // The link target is checked whenever something opens the link
#ifdef SYS_symlink
    case SYS_symlink:
        return {{AT_FDCWD, args[1], WRITE, false}};
#endif
    case SYS_symlinkat:
        return {{int_arg(args[1]), args[2], WRITE, false}};
    default:
        return {};
    }
}

std::optional<std::filesystem::path> SyscallWatch::resolve(pid_t tid, const PathOperand& operand,
                                                           const std::string& raw) {
    namespace fs = std::filesystem;

    std::string path_str = raw;

    // "self" in the tracee's paths is the tracee, not us
    for (const auto& [prefix, replacement] :
         {std::pair{std::string_view{"/proc/thread-self"}, fmt::format("/proc/{}/task/{}", tid, tid)},
          std::pair{std::string_view{"/proc/self"}, fmt::format("/proc/{}", tid)}}) {
        if (path_str.starts_with(prefix) && (path_str.size() == prefix.size() || path_str[prefix.size()] == '/')) {
            path_str.replace(0, prefix.size(), replacement);
            break;
        }
    }

    fs::path path{path_str};

    if (path.is_relative()) {
        const fs::path base = operand.dirfd == AT_FDCWD ? fmt::format("/proc/{}/cwd", tid)
                                                        : fmt::format("/proc/{}/fd/{}", tid, operand.dirfd);
        path = base / path;
    }

    std::error_code err;

    if (!operand.follow && path.has_filename()) {
        auto parent = fs::weakly_canonical(path.parent_path(), err);

        if (err) {
            return std::nullopt;
        }

        return (parent / path.filename()).lexically_normal();
    }

    auto resolved = fs::weakly_canonical(path, err);

    if (err) {
        return std::nullopt;
    }

    return resolved;
}

std::optional<std::string> SyscallWatch::read_string(pid_t tid, std::uint64_t address) {
    std::string result;
    std::array<char, MAX_PATH_LENGTH> buffer{};

    // Page by page, as the string may end right before an unmapped page
    while (result.size() < MAX_PATH_LENGTH) {
        const std::size_t to_page_end = 4096 - (address % 4096);
        const std::size_t count = std::min(to_page_end, MAX_PATH_LENGTH - result.size());

        auto copied = linux::process_vm_readv(tid, address, buffer.data(), count);

        if (!copied || copied.value() == 0) {
            return std::nullopt;
        }

        const std::string_view chunk{buffer.data(), copied.value()};
        const auto nul = chunk.find('\0');

        if (nul != std::string_view::npos) {
            result.append(chunk.substr(0, nul));
            return result;
        }

        result.append(chunk);
        address += copied.value();
    }

    // Longer than PATH_MAX; the kernel refuses it with ENAMETOOLONG
    return std::nullopt;
}

void SyscallWatch::sample_peak(pid_t tid) {
    // Before execve the task is a copy of this process
    if (!exec_seen_) {
        return;
    }

    // e.g. "VmHWM:\t    1234 kB"
    std::ifstream status{fmt::format("/proc/{}/status", tid)};
    std::string line;

    while (std::getline(status, line)) {
        if (!line.starts_with("VmHWM:")) {
            continue;
        }

        std::istringstream fields{line.substr(std::string_view{"VmHWM:"}.size())};
        std::uint64_t kib = 0;

        if (fields >> kib) {
            peak_rss_ = std::max(peak_rss_, kib * 1024);
        }

        return;
    }
}

std::optional<SyscallWatch::SyscallRequest> SyscallWatch::read_syscall(pid_t tid) {
    // Format (see proc(5)): "<nr> <arg0> ... <arg5> <sp> <pc>", arguments in hex
    std::ifstream proc_syscall{fmt::format("/proc/{}/syscall", tid)};

    SyscallRequest request{};

    if (!(proc_syscall >> request.nr) || request.nr < 0) {
        return std::nullopt;
    }

    proc_syscall >> std::hex;

    for (std::uint64_t& arg : request.args) {
        if (!(proc_syscall >> arg)) {
            return std::nullopt;
        }
    }

    return request;
}

std::optional<std::uint64_t> SyscallWatch::read_vm_pages(pid_t tid) {
    // First field of statm is the total program size in pages
    std::ifstream proc_statm{fmt::format("/proc/{}/statm", tid)};

    std::uint64_t pages{};

    if (!(proc_statm >> pages)) {
        return std::nullopt;
    }

    return pages;
}

Result<void> SyscallWatch::resume(pid_t tid, int signal_num) {
    auto res = linux::ptrace(PTRACE_CONT, tid, nullptr, static_cast<long>(signal_num)); // NOLINT(google-runtime-int)

    // The task may already have been killed since it was reported
    if (!res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    return {};
}

} // namespace judgebox
