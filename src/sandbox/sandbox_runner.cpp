#include <judgebox/sandbox/sandbox_runner.hpp>

#include <judgebox/common/class_traits.hpp>
#include <judgebox/common/error_types.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/execution_backend.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/posix_backend.hpp>
#include <judgebox/sandbox/submission.hpp>
#include <judgebox/sandbox/workspace.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <poll.h>

namespace judgebox {

namespace {

/// Bounded capture of one of the child's output pipes. Owns (and closes) the read end.
class PipeCapture : NonMovable
{
public:
    PipeCapture(int fd, std::size_t limit)
        : fd_{fd}
        , limit_{limit} {}


    ~PipeCapture() { close(); }

    int get_fd() const { return fd_; }

    /// Read what is currently available. Bytes past the limit are discarded and flag an overflow.
    Result<void> drain() {
        for (std::size_t i = 0; i < MAX_CHUNKS_PER_DRAIN && fd_ != -1; ++i) {
            auto chunk = linux::read(fd_, CHUNK_SIZE);

            if (!chunk) {
                if (chunk.error() == std::errc::resource_unavailable_try_again) {
                    return {};
                }
                if (chunk.error() == std::errc::interrupted) {
                    continue;
                }
                return ErrorKind::SyscallFailure;
            }

            // EOF: every writer is gone
            if (chunk.value().empty()) {
                close();
                return {};
            }

            const std::size_t room = limit_ - data_.size();

            if (chunk.value().size() > room) {
                overflowed_ = true;
            }

            data_.append(chunk.value(), 0, std::min(room, chunk.value().size()));
        }

        return {};
    }

    bool overflowed() const { return overflowed_; }

    std::string take() { return std::exchange(data_, {}); }

private:
    void close() {
        if (fd_ != -1) {
            std::ignore = linux::close(fd_);
            fd_ = -1;
        }
    }

    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    // Keeps a flood on one pipe from starving the rest of the supervisor loop
    static constexpr std::size_t MAX_CHUNKS_PER_DRAIN = 16;

    int fd_;
    std::size_t limit_;
    std::string data_;
    bool overflowed_ = false;
};

/// Sleep until either pipe is readable or ``timeout`` passes
Result<void> wait_readable(const PipeCapture& out, const PipeCapture& err, std::chrono::milliseconds timeout) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;

    for (const PipeCapture* capture : {&out, &err}) {
        if (capture->get_fd() != -1) {
            fds[count++] = pollfd{.fd = capture->get_fd(), .events = POLLIN, .revents = 0};
        }
    }

    auto res = linux::poll(fds.data(), count, gsl::narrow_cast<int>(timeout.count()));

    if (!res && res.error() != std::errc::interrupted) {
        return ErrorKind::SyscallFailure;
    }

    return {};
}

} // namespace

SandboxRunner::SandboxRunner(SandboxConfig config, BackendFactory backend_factory)
    : config_{std::move(config)}
    , backend_factory_{std::move(backend_factory)} {
    if (!backend_factory_) {
        backend_factory_ = [] { return std::make_unique<PosixBackend>(); };
    }
}

const std::vector<std::string>& SandboxRunner::child_environment() {
    static const std::vector<std::string> env{"PATH=/usr/bin:/bin"};
    return env;
}

Result<ExecutionResult> SandboxRunner::run(const Submission& submission, std::stop_token stop_token) const {
    using std::chrono::steady_clock;

    const ResourceLimits& limits = submission.limits;

    LOG_DEBUG("Running {} ({}, limits={})", submission.executable, submission.io_mode, limits);

    // Declared first so that it outlives the backend, which kills and reaps the child on destruction
    std::optional<Workspace> workspace;

    std::unique_ptr<ExecutionBackend> backend = backend_factory_();
    ASSERT(backend != nullptr);

    TRY(backend->install_limits(limits));

    workspace.emplace(TRY(Workspace::create(config_.sandbox_root, config_.keep_sandbox)));

    SpawnRequest request{
        .executable = submission.executable,
        .args = submission.args,
        .env = child_environment(),
        .working_dir = workspace->path(),
        .sandbox_root = config_.sandbox_root,
        .stdin_path = "/dev/null",
    };

    if (submission.io_mode == IoMode::File) {
        TRY(workspace->write_file(Submission::INPUT_FILE_NAME, submission.input));
    } else {
        TRY(workspace->write_file(STDIN_FILE_NAME, submission.input));
        request.stdin_path = workspace->file(STDIN_FILE_NAME);
    }

    const ChildPipes pipes = TRY(backend->spawn(request));
    const auto start = steady_clock::now();
    const auto deadline = start + limits.deadline();

    PipeCapture stdout_capture{pipes.stdout_fd, gsl::narrow_cast<std::size_t>(limits.output_limit)};
    PipeCapture stderr_capture{pipes.stderr_fd, config_.stderr_limit};

    KillReason kill_reason = KillReason::None;
    std::optional<ChildExit> child_exit;

    while (!child_exit) {
        TRY(wait_readable(stdout_capture, stderr_capture, config_.poll_period));
        TRY(stdout_capture.drain());
        TRY(stderr_capture.drain());

        child_exit = TRY(backend->wait_for(std::chrono::milliseconds::zero()));

        if (child_exit) {
            break;
        }

        if (backend->memory_limit_hit()) {
            kill_reason = KillReason::MemoryLimit;
        } else if (backend->forbidden_access()) {
            kill_reason = KillReason::ForbiddenAccess;
        } else if (stdout_capture.overflowed()) {
            kill_reason = KillReason::OutputLimit;
        } else if (stop_token.stop_requested()) {
            kill_reason = KillReason::Cancelled;
        } else if (steady_clock::now() >= deadline) {
            kill_reason = KillReason::WallTimeout;
        } else {
            continue;
        }

        LOG_DEBUG("Killing {} ({})", submission.executable, kill_reason);

        TRY(backend->kill());
        child_exit = TRY(backend->wait_for(config_.reap_timeout));

        if (!child_exit) {
            LOG_ERROR("{} was killed ({}) but did not terminate within {}ms", submission.executable, kill_reason,
                      config_.reap_timeout.count());
            return ErrorKind::TimedOut;
        }
    }

    const auto wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start);

    // Whatever is still buffered in the pipes
    TRY(stdout_capture.drain());
    TRY(stderr_capture.drain());

    ExecutionResult result{
        .status = child_exit->status,
        .kill_reason = kill_reason,
        .limits = limits,
        .wall_time = wall_time,
        .cpu_time = child_exit->cpu_time,
        .peak_memory = child_exit->peak_memory,
        .memory_limit_hit = backend->memory_limit_hit(),
        .violation = backend->forbidden_access(),
        .stdout_data = stdout_capture.take(),
        .stderr_data = stderr_capture.take(),
        .output_file = std::nullopt,
        .output_truncated = stdout_capture.overflowed(),
    };

    if (submission.io_mode == IoMode::File) {
        auto contents = TRY(workspace->read_file(Submission::OUTPUT_FILE_NAME, limits.output_limit));

        if (contents) {
            result.output_file = std::move(contents->data);
            result.output_truncated = result.output_truncated || contents->truncated;
        } else {
            result.output_file = std::string{};
        }
    }

    LOG_DEBUG("{} finished: {}, kill_reason={}, wall={}ms, cpu={}ms, peak={}B", submission.executable, result.status,
              result.kill_reason, result.wall_time.count(), result.cpu_time.count(), result.peak_memory);

    return result;
}

} // namespace judgebox
