#pragma once

#include <judgebox/common/extra_formatters.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/sandbox/resource_limits.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace judgebox {

/// How a process terminated
class ExitStatus
{
public:
    enum class Kind { Exited, Signaled };

    static ExitStatus make_exited(int code) { return {Kind::Exited, code}; }

    static ExitStatus make_signaled(int signal_num) { return {Kind::Signaled, signal_num}; }

    /// Decode a status as reported by wait(2). The status must describe a terminated process.
    static ExitStatus from_wait_status(int status);

    Kind get_kind() const { return kind_; }

    /// Exit code or signal number, depending on ``get_kind``
    int get_code() const { return code_; }

    bool is_clean_exit() const { return kind_ == Kind::Exited && code_ == 0; }

    bool is_signal(int signal_num) const { return kind_ == Kind::Signaled && code_ == signal_num; }

    bool operator==(const ExitStatus&) const = default;

private:
    ExitStatus(Kind kind, int code)
        : kind_{kind}
        , code_{code} {}

    Kind kind_;
    int code_;
};

/// Why the supervisor, rather than the program itself or the kernel, ended a run
enum class KillReason {
    None,
    WallTimeout, ///< time limit + grace period elapsed
    OutputLimit, ///< captured stdout overflowed the output limit
    MemoryLimit,     ///< the syscall watch saw an allocation the address-space limit would refuse
    ForbiddenAccess, ///< the program tried to reach files or processes outside its workspace
    Cancelled,       ///< a stop was requested through the run's stop token
};

BOOST_DESCRIBE_ENUM(KillReason, None, WallTimeout, OutputLimit, MemoryLimit, ForbiddenAccess, Cancelled);

/// Raw outcome of one execution attempt. Built once by the runner and never modified afterwards.
struct ExecutionResult
{
    ExitStatus status = ExitStatus::make_exited(0);
    KillReason kill_reason = KillReason::None;

    /// The limits the run was held to
    ResourceLimits limits;

    std::chrono::milliseconds wall_time{};
    std::chrono::milliseconds cpu_time{};
    std::uint64_t peak_memory = 0;

    /// Set when an address-space growth request was seen that would exceed the ceiling
    bool memory_limit_hit = false;

    /// The first thing the program was stopped from doing outside its confinement
    std::optional<std::string> violation;

    std::string stdout_data;
    std::string stderr_data;

    /// Contents of ``output.txt`` in file mode; empty if the program never created it
    std::optional<std::string> output_file;

    /// Output (stdout or the output file) went past the output limit and was cut off
    bool output_truncated = false;

    /// What the checker should see: the output file in file mode, stdout otherwise
    std::string_view answer() const { return output_file ? std::string_view{*output_file} : stdout_data; }
};

} // namespace judgebox

template <>
struct fmt::formatter<::judgebox::ExitStatus> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::ExitStatus& from, format_context& ctx) const {
        if (from.get_kind() == ::judgebox::ExitStatus::Kind::Signaled) {
            return fmt::format_to(ctx.out(), "killed by {}", ::judgebox::linux::Signal{from.get_code()});
        }

        return fmt::format_to(ctx.out(), "exited with code {}", from.get_code());
    }
};
