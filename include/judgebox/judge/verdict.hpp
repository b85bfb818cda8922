#pragma once

#include <judgebox/common/extra_formatters.hpp>
#include <judgebox/sandbox/execution_result.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace judgebox {

enum class VerdictKind {
    Correct,
    WrongAnswer,
    PartiallyCorrect,
    RuntimeError,
    TimeLimitExceeded,
    MemoryLimitExceeded,
    OutputLimitExceeded,
    InternalError,
};

BOOST_DESCRIBE_ENUM(VerdictKind, Correct, WrongAnswer, PartiallyCorrect, RuntimeError, TimeLimitExceeded,
                    MemoryLimitExceeded, OutputLimitExceeded, InternalError);

/// Two/three letter abbreviation as used on judge scoreboards, e.g. "TLE"
constexpr const char* short_name(VerdictKind kind) {
    switch (kind) {
    case VerdictKind::Correct:
        return "OK";
    case VerdictKind::WrongAnswer:
        return "WA";
    case VerdictKind::PartiallyCorrect:
        return "PC";
    case VerdictKind::RuntimeError:
        return "RE";
    case VerdictKind::TimeLimitExceeded:
        return "TLE";
    case VerdictKind::MemoryLimitExceeded:
        return "MLE";
    case VerdictKind::OutputLimitExceeded:
        return "OLE";
    case VerdictKind::InternalError:
        return "IE";
    }
    return "??";
}

struct ResourceUsage
{
    std::chrono::milliseconds wall_time{};
    std::chrono::milliseconds cpu_time{};
    std::uint64_t peak_memory = 0;

    /// Absent when the program never ran (infrastructure failure)
    std::optional<ExitStatus> exit_status;

    static ResourceUsage from(const ExecutionResult& result) {
        return {.wall_time = result.wall_time,
                .cpu_time = result.cpu_time,
                .peak_memory = result.peak_memory,
                .exit_status = result.status};
    }

    bool operator==(const ResourceUsage&) const = default;
};

/// The single, final outcome of judging one submission
struct Verdict
{
    VerdictKind kind = VerdictKind::InternalError;

    /// In [0, 1]; present whenever the checker produced a decision
    std::optional<double> score;

    std::optional<std::string> message;

    ResourceUsage usage;

    bool is_correct() const { return kind == VerdictKind::Correct; }

    static Verdict make_internal_error(std::string message, ResourceUsage usage = {}) {
        return {.kind = VerdictKind::InternalError,
                .score = std::nullopt,
                .message = std::move(message),
                .usage = std::move(usage)};
    }
};

} // namespace judgebox

template <>
struct fmt::formatter<::judgebox::Verdict> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::Verdict& from, format_context& ctx) const {
        auto out = fmt::format_to(ctx.out(), "{}", from.kind);

        if (from.score && from.kind == ::judgebox::VerdictKind::PartiallyCorrect) {
            out = fmt::format_to(out, " ({:.3g})", *from.score);
        }

        if (from.message) {
            out = fmt::format_to(out, ": {}", *from.message);
        }

        if (is_debug_format) {
            out = fmt::format_to(out, " [wall={}ms, cpu={}ms, peak={}B]", from.usage.wall_time.count(),
                                 from.usage.cpu_time.count(), from.usage.peak_memory);
        }

        return out;
    }
};
