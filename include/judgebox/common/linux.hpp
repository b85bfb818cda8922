#pragma once

#include <judgebox/common/expected.hpp>
#include <judgebox/common/extra_formatters.hpp>
#include <judgebox/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/ptrace.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <sys/wait.h>
#include <unistd.h>

namespace judgebox::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err);
        return err;
    }

    return res;
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level, except for EAGAIN on non-blocking fds
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err);
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err);
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    int res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err);
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err);

        return err;
    }

    return Expected<int>{res};
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); logs failure at debug level
inline Expected<int> poll(struct pollfd* fds, nfds_t nfds, int timeout_ms) {
    int res = ::poll(fds, nfds, timeout_ms);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    return res;
}

/// Result of a successful wait4(2) that reported a state change
struct WaitResult
{
    pid_t pid;
    int status;
    struct rusage usage;
};

/// see wait4(2)
/// returns nullopt if WNOHANG was given and no child has changed state; logs failure at debug level
inline Expected<std::optional<WaitResult>> wait4(pid_t pid, int options) {
    WaitResult result{};

    pid_t res = ::wait4(pid, &result.status, options, &result.usage);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("wait4(pid={}) failed: '{}'", pid, err);

        return err;
    }

    if (res == 0) {
        return std::optional<WaitResult>{};
    }

    result.pid = res;

    return std::optional{result};
}

/// see process_vm_readv(2); reads up to ``count`` bytes at ``address`` in the memory of ``pid``
/// returns the number of bytes read, which may be short at an unmapped page; logs failure at debug level
inline Expected<std::size_t> process_vm_readv(pid_t pid, std::uintptr_t address, void* buffer, std::size_t count) {
    iovec local{.iov_base = buffer, .iov_len = count};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast,performance-no-int-to-ptr)
    iovec remote{.iov_base = reinterpret_cast<void*>(address), .iov_len = count};

    ssize_t res = ::process_vm_readv(pid, &local, 1, &remote, 1, 0);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("process_vm_readv(pid={}, addr={:#x}) failed: '{}'", pid, address, err);

        return err;
    }

    return static_cast<std::size_t>(res);
}

namespace detail {

/// ptrace(2) takes its addr and data arguments as ``void*``, but callers pass pointers, integers
/// (options, signal numbers) or nullptr
template <typename T>
void* to_ptrace_arg(T arg) {
    if constexpr (std::is_null_pointer_v<T>) {
        return nullptr;
    } else if constexpr (std::is_pointer_v<T>) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
        return const_cast<void*>(static_cast<const void*>(arg));
    } else {
        static_assert(std::is_integral_v<T>);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast,performance-no-int-to-ptr)
        return reinterpret_cast<void*>(static_cast<std::uintptr_t>(arg));
    }
}

} // namespace detail

/// see ptrace(2)
/// returns success/failure; logs failure at debug level
// NOLINTBEGIN(google-runtime-int)
template <typename AddrT = std::nullptr_t, typename DataT = std::nullptr_t>
    requires(sizeof(AddrT) <= sizeof(void*) && sizeof(DataT) <= sizeof(void*))
inline Expected<long> ptrace(int request, pid_t pid = 0, AddrT addr = nullptr, DataT data = nullptr) {
    //  clear errno before calling
    errno = 0;

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    long res = ::ptrace(static_cast<enum __ptrace_request>(request), pid, detail::to_ptrace_arg(addr),
                        detail::to_ptrace_arg(data));
    // NOLINTEND(google-runtime-int)

    // see the Return section of ptrace(2)
    if (errno) {
        auto err = make_error_code(errno);

        LOG_DEBUG("ptrace(req={}, pid={}) failed: '{}'", request, pid, err);

        return err;
    }

    return res;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// e.g. "SIGSEGV"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        return abbrev != nullptr ? fmt::format("SIG{}", abbrev) : fmt::format("signal {}", signal_num_);
    }

    /// e.g. "Segmentation fault"
    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr != nullptr ? descr : "Unknown signal";
    }

private:
    int signal_num_;
};

using SignalHandlerT = void (*)(int);

/// see sigaction(2); installs ``handler`` with an empty mask and SA_RESTART
inline Expected<> sigaction(Signal sig, SignalHandlerT handler) {
    struct ::sigaction action{};
    action.sa_handler = handler;
    action.sa_flags = SA_RESTART;
    sigemptyset(&action.sa_mask);

    int res = ::sigaction(sig, &action, nullptr);

    if (res == -1) {
        auto err = make_error_code();

        LOG_DEBUG("sigaction({}) failed: '{}'", sig, err);

        return err;
    }

    return {};
}

} // namespace judgebox::linux

template <>
struct fmt::formatter<::judgebox::linux::Signal> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::linux::Signal& from, format_context& ctx) const {
        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "{} ({})", from.name(), from.to_string());
        }

        return fmt::format_to(ctx.out(), "{}", from.name());
    }
};
