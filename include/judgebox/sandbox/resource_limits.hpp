#pragma once

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/extra_formatters.hpp>

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include <sys/resource.h>

namespace judgebox {

/// Every limit a single run is held to. Sizes are in bytes.
struct ResourceLimits
{
    static constexpr std::chrono::milliseconds DEFAULT_TIME_LIMIT{1000};
    static constexpr std::uint64_t DEFAULT_MEMORY_LIMIT = 256ULL * 1024 * 1024;
    static constexpr std::uint64_t DEFAULT_OUTPUT_LIMIT = 64ULL * 1024 * 1024;
    static constexpr std::chrono::milliseconds DEFAULT_GRACE_PERIOD{500};

    std::chrono::milliseconds time_limit = DEFAULT_TIME_LIMIT;
    std::uint64_t memory_limit = DEFAULT_MEMORY_LIMIT;
    std::uint64_t output_limit = DEFAULT_OUTPUT_LIMIT;

    /// Extra wall-clock time past ``time_limit`` before the supervisor kills the process
    std::chrono::milliseconds grace_period = DEFAULT_GRACE_PERIOD;

    /// Address space allowed beyond ``memory_limit``
    std::uint64_t memory_slack = 0;

    /// Defaults to ``memory_limit``
    std::optional<std::uint64_t> stack_limit;

    std::optional<std::uint64_t> process_limit;

    std::uint64_t address_space_limit() const { return memory_limit + memory_slack; }

    std::chrono::milliseconds deadline() const { return time_limit + grace_period; }

    bool operator==(const ResourceLimits&) const = default;
};

/// Installs a precomputed set of rlimits in a freshly forked child.
///
/// All validation and arithmetic is done in ``prepare``, in the parent. ``install`` only
/// issues setrlimit(2), so it is safe to call between fork(2) and execve(2).
class ResourceLimiter
{
public:
    struct Entry
    {
        int resource;
        rlimit value;
    };

    static constexpr std::size_t MAX_ENTRIES = 6;

    /// Validates ``limits`` (``BadArgument`` for non-positive time, memory or output ceilings)
    /// and computes the rlimit table
    static Result<ResourceLimiter> prepare(const ResourceLimits& limits);

    /// Returns 0 on success, otherwise the errno of the first setrlimit(2) that failed
    int install() const noexcept;

    std::span<const Entry> entries() const { return {entries_.data(), num_entries_}; }

    /// The RLIMIT_CPU soft limit for a given time limit: ceil(time_limit) + 1 second
    static std::chrono::seconds cpu_soft_limit(std::chrono::milliseconds time_limit);

private:
    ResourceLimiter() = default;

    void add(int resource, rlim_t soft, rlim_t hard);

    std::array<Entry, MAX_ENTRIES> entries_{};
    std::size_t num_entries_ = 0;
};

} // namespace judgebox

template <>
struct fmt::formatter<::judgebox::ResourceLimits> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::ResourceLimits& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{{time={}ms, memory={}B, output={}B, grace={}ms}}", from.time_limit.count(),
                              from.memory_limit, from.output_limit, from.grace_period.count());
    }
};
