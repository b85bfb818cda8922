#include <judgebox/sandbox/posix_backend.hpp>

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/path_policy.hpp>
#include <judgebox/sandbox/resource_limits.hpp>
#include <judgebox/sandbox/syscall_watch.hpp>

#include <boost/describe/enum.hpp>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <vector>

#include <fcntl.h>
#include <linux/seccomp.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/ptrace.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

namespace judgebox {

namespace {

/// Steps the child goes through between fork and execve, in order
enum class ChildStage { Setup, Chdir, Redirect, Limits, Trace, Seccomp, Exec };

BOOST_DESCRIBE_ENUM(ChildStage, Setup, Chdir, Redirect, Limits, Trace, Seccomp, Exec);

/// Written by the child to the status pipe if a stage fails
struct ChildError
{
    ChildStage stage;
    int err;
};

/// Exit code of a child that failed before execve
constexpr int CHILD_SETUP_FAILURE = 127;

/// Everything the child reads, laid out before fork so that the child only issues raw syscalls
struct ExecImage
{
    std::string executable;
    std::string working_dir;
    std::string stdin_path;

    std::vector<std::string> argv_storage;
    std::vector<std::string> envp_storage;

    std::vector<char*> argv;
    std::vector<char*> envp;
};

ExecImage make_exec_image(const SpawnRequest& request) {
    ExecImage image;

    image.executable = std::filesystem::absolute(request.executable).string();
    image.working_dir = request.working_dir.string();
    image.stdin_path = request.stdin_path.string();

    image.argv_storage.push_back(image.executable);
    image.argv_storage.insert(image.argv_storage.end(), request.args.begin(), request.args.end());
    image.envp_storage = request.env;

    // Reason: execve requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    std::ranges::transform(image.argv_storage, std::back_inserter(image.argv), to_cstr);
    std::ranges::transform(image.envp_storage, std::back_inserter(image.envp), to_cstr);
    image.argv.push_back(nullptr);
    image.envp.push_back(nullptr);

    return image;
}

struct ChildFds
{
    int stdout_fd;
    int stderr_fd;
    int status_fd;
};

/// Runs in the forked child. Only async-signal-safe calls from here on; no allocation, no logging.
[[noreturn]] void exec_child(const ExecImage& image, const ChildFds& fds, const ResourceLimiter& limiter,
                             const SyscallWatch& watch) noexcept {
    const auto fail = [&](ChildStage stage) {
        const ChildError error{.stage = stage, .err = errno};
        std::ignore = ::write(fds.status_fd, &error, sizeof(error));
        ::_exit(CHILD_SETUP_FAILURE);
    };

    sigset_t empty_mask;
    sigemptyset(&empty_mask);

    // Own process group, so that the supervisor can kill everything the candidate starts.
    // Die with the supervising thread.
    if (::sigprocmask(SIG_SETMASK, &empty_mask, nullptr) != 0 || ::signal(SIGPIPE, SIG_DFL) == SIG_ERR ||
        ::setpgid(0, 0) != 0 || ::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) {
        fail(ChildStage::Setup);
    }

    if (::chdir(image.working_dir.c_str()) != 0) {
        fail(ChildStage::Chdir);
    }

    // NOLINTNEXTLINE(*vararg)
    const int stdin_fd = ::open(image.stdin_path.c_str(), O_RDONLY | O_CLOEXEC);

    if (stdin_fd == -1 || ::dup2(stdin_fd, STDIN_FILENO) == -1 || ::dup2(fds.stdout_fd, STDOUT_FILENO) == -1 ||
        ::dup2(fds.stderr_fd, STDERR_FILENO) == -1) {
        fail(ChildStage::Redirect);
    }

    if (const int err = limiter.install(); err != 0) {
        errno = err;
        fail(ChildStage::Limits);
    }

    // NOLINTNEXTLINE(*vararg)
    if (::ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) == -1 || ::raise(SIGSTOP) != 0) {
        fail(ChildStage::Trace);
    }

    // NOLINTNEXTLINE(*vararg)
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0 ||
        ::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, watch.filter_program()) != 0) { // NOLINT(*vararg)
        fail(ChildStage::Seccomp);
    }

    ::execve(image.executable.c_str(), image.argv.data(), image.envp.data());

    fail(ChildStage::Exec);
    ::_exit(CHILD_SETUP_FAILURE);
}

void close_fd(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

std::chrono::milliseconds to_millis(const timeval& time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds{time.tv_sec} +
                                                                 std::chrono::microseconds{time.tv_usec});
}

} // namespace

PosixBackend::~PosixBackend() {
    if (pid_ == -1 || swept_) {
        return;
    }

    if (!exit_) {
        std::ignore = kill();
    }

    auto res = wait_for(DESTRUCTOR_REAP_TIMEOUT);

    if (!res || !res.value().has_value()) {
        LOG_ERROR("Child {} could not be reaped before its backend was destroyed", pid_);
    }
}

Result<void> PosixBackend::install_limits(const ResourceLimits& limits) {
    limiter_ = TRY(ResourceLimiter::prepare(limits));
    address_space_limit_ = limits.address_space_limit();

    return {};
}

Result<ChildPipes> PosixBackend::spawn(const SpawnRequest& request) {
    ASSERT(limiter_.has_value(), "install_limits must succeed before spawn");
    ASSERT(pid_ == -1, "a PosixBackend drives a single child");

    const ExecImage image = make_exec_image(request);

    watch_.emplace(address_space_limit_, PathPolicy{request.working_dir, request.sandbox_root});

    // Read ends are handed to the caller on success; everything else is closed here
    bool spawned = false;

    linux::Pipe stdout_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);
    auto close_stdout = gsl::finally([&] {
        close_fd(stdout_pipe.write_fd);
        if (!spawned) {
            close_fd(stdout_pipe.read_fd);
        }
    });

    linux::Pipe stderr_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);
    auto close_stderr = gsl::finally([&] {
        close_fd(stderr_pipe.write_fd);
        if (!spawned) {
            close_fd(stderr_pipe.read_fd);
        }
    });

    linux::Pipe status_pipe = TRYE(linux::pipe2(O_CLOEXEC), SpawnFailure);
    auto close_status = gsl::finally([&] {
        close_fd(status_pipe.write_fd);
        close_fd(status_pipe.read_fd);
    });

    linux::Fork fork_res = TRYE(linux::fork(), SpawnFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(image,
                   ChildFds{.stdout_fd = stdout_pipe.write_fd,
                            .stderr_fd = stderr_pipe.write_fd,
                            .status_fd = status_pipe.write_fd},
                   *limiter_, *watch_);
    }

    pid_ = fork_res.pid;
    LOG_DEBUG("Spawned {:?} as pid {}, confined to {:?}", image.executable, pid_, request.working_dir);

    // Our copies of the write ends must go, or EOF never arrives
    close_fd(stdout_pipe.write_fd);
    close_fd(stderr_pipe.write_fd);
    close_fd(status_pipe.write_fd);

    auto attach_res = watch_->attach(pid_);

    if (!attach_res) {
        LOG_ERROR("Failed to attach syscall watch to pid {}: {}", pid_, attach_res.error());
        std::ignore = kill();
        std::ignore = wait_for(DESTRUCTOR_REAP_TIMEOUT);
        return attach_res.error();
    }

    TRY(check_child_setup(status_pipe.read_fd, attach_res.value()));

    for (int read_fd : {stdout_pipe.read_fd, stderr_pipe.read_fd}) {
        int flags = TRYE(linux::fcntl(read_fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(read_fd, F_SETFL, flags | O_NONBLOCK), SyscallFailure);
    }

    spawned = true;

    return ChildPipes{.stdout_fd = stdout_pipe.read_fd, .stderr_fd = stderr_pipe.read_fd};
}

Result<void> PosixBackend::check_child_setup(int status_fd, std::optional<int> early_exit_status) {
    // EOF without data: the status pipe was closed by a successful execve
    Expected<std::string> report;

    do {
        report = linux::read(status_fd, sizeof(ChildError));
    } while (!report && report.error() == std::errc::interrupted);

    if (!report) {
        return ErrorKind::SyscallFailure;
    }

    if (report.value().empty()) {
        if (early_exit_status) {
            // Died before execve without saying why, e.g. killed by a signal
            LOG_ERROR("Child {} terminated before execve ({})", pid_,
                      ExitStatus::from_wait_status(*early_exit_status));
            swept_ = true;
            return ErrorKind::SpawnFailure;
        }

        return {};
    }

    if (report.value().size() != sizeof(ChildError)) {
        LOG_ERROR("Short setup report from child {} ({} bytes)", pid_, report.value().size());
        std::ignore = kill();
    }

    ChildError error{};
    std::memcpy(&error, report.value().data(), std::min(report.value().size(), sizeof(error)));

    LOG_ERROR("Child {} failed to start at stage {}: '{}'", pid_, error.stage, linux::make_error_code(error.err));

    // The child _exits right after reporting; collect it
    if (!early_exit_status) {
        auto reaped = TRYE(linux::wait4(pid_, __WALL), SyscallFailure);
        DEBUG_ASSERT(reaped.has_value());
    }

    swept_ = true;

    switch (error.stage) {
    case ChildStage::Limits:
    case ChildStage::Trace:
    case ChildStage::Seccomp:
        return ErrorKind::LimitSetupFailure;
    default:
        return ErrorKind::SpawnFailure;
    }
}

Result<std::optional<ChildExit>> PosixBackend::wait_for(std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    ASSERT(pid_ != -1, "wait_for called before spawn");

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        if (!exit_) {
            TRY(reap_pending());
        }

        if (exit_) {
            sweep();
            return exit_;
        }

        const auto now = steady_clock::now();

        if (now >= deadline) {
            return std::optional<ChildExit>{};
        }

        std::this_thread::sleep_for(std::min<steady_clock::duration>(REAP_POLL_PERIOD, deadline - now));
    }
}

Result<void> PosixBackend::reap_pending() {
    ASSERT(watch_.has_value(), "reap_pending called before spawn");

    // Traced tasks are reported to this thread only
    while (true) {
        auto wait_res = linux::wait4(-1, WNOHANG | __WALL | __WNOTHREAD);

        if (!wait_res) {
            if (wait_res.error() == std::errc::interrupted) {
                continue;
            }

            if (wait_res.error() == std::errc::no_child_process) {
                return {};
            }

            return ErrorKind::SyscallFailure;
        }

        if (!wait_res.value().has_value()) {
            return {};
        }

        const linux::WaitResult& change = *wait_res.value();

        if (WIFSTOPPED(change.status)) {
            TRY(watch_->on_stop(change.pid, change.status));
            continue;
        }

        watch_->forget(change.pid);

        if (change.pid == pid_) {
            exit_ = ChildExit{
                .status = ExitStatus::from_wait_status(change.status),
                .cpu_time = to_millis(change.usage.ru_utime) + to_millis(change.usage.ru_stime),
                // ru_maxrss would include what the forked copy of this process had resident
                .peak_memory = watch_->peak_rss(),
            };

            LOG_DEBUG("pid {} {} (cpu={}ms, peak rss={}B)", pid_, exit_->status, exit_->cpu_time.count(),
                      exit_->peak_memory);
        }
    }
}

void PosixBackend::sweep() {
    if (swept_) {
        return;
    }

    // Anything the candidate left running
    std::ignore = kill();

    const auto deadline = std::chrono::steady_clock::now() + SWEEP_TIMEOUT;

    while (watch_ && !watch_->tasks().empty() && std::chrono::steady_clock::now() < deadline) {
        if (!reap_pending()) {
            break;
        }

        std::this_thread::sleep_for(REAP_POLL_PERIOD);
    }

    if (watch_ && !watch_->tasks().empty()) {
        LOG_WARN("{} traced task(s) of pid {} outlived the sweep", watch_->tasks().size(), pid_);
    }

    swept_ = true;
}

Result<void> PosixBackend::kill() {
    if (pid_ == -1 || swept_) {
        return {};
    }

    bool failed = false;

    auto check = [&](const Expected<>& res) {
        if (!res && res.error() != std::errc::no_such_process) {
            failed = true;
        }
    };

    // SIGKILL skips the exit event, so this is the last chance to see the peak
    if (!exit_) {
        watch_->sample_peak(pid_);
    }

    // The child is the leader of its own process group
    check(linux::kill(-pid_, SIGKILL));

    // Traced tasks may have left the group with setsid/setpgid
    for (pid_t tid : watch_->tasks()) {
        check(linux::kill(tid, SIGKILL));
    }

    if (failed) {
        return ErrorKind::SyscallFailure;
    }

    return {};
}

} // namespace judgebox
