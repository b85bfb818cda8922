#include "catch2_custom.hpp"

#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/resource_limits.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>

#include <sys/resource.h>

using namespace std::chrono_literals;
using judgebox::ErrorKind;
using judgebox::ResourceLimiter;
using judgebox::ResourceLimits;

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

std::optional<rlimit> find_entry(const ResourceLimiter& limiter, int resource) {
    auto entries = limiter.entries();
    auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& entry) { return entry.resource == resource; });

    if (it == entries.end()) {
        return std::nullopt;
    }

    return it->value;
}

} // namespace

TEST_CASE("CPU soft limit rounds up and adds a second") {
    REQUIRE(ResourceLimiter::cpu_soft_limit(1000ms) == 2s);
    REQUIRE(ResourceLimiter::cpu_soft_limit(1001ms) == 3s);
    REQUIRE(ResourceLimiter::cpu_soft_limit(1500ms) == 3s);
    REQUIRE(ResourceLimiter::cpu_soft_limit(1ms) == 2s);
}

TEST_CASE("Derived limits") {
    ResourceLimits limits{.time_limit = 2000ms, .memory_limit = 64 * MiB, .grace_period = 250ms, .memory_slack = MiB};

    REQUIRE(limits.address_space_limit() == 65 * MiB);
    REQUIRE(limits.deadline() == 2250ms);
}

TEST_CASE("Invalid limits are rejected before anything runs") {
    ResourceLimits limits;

    SECTION("zero time limit") {
        limits.time_limit = 0ms;
    }

    SECTION("negative time limit") {
        limits.time_limit = -5ms;
    }

    SECTION("zero memory limit") {
        limits.memory_limit = 0;
    }

    SECTION("zero output limit") {
        limits.output_limit = 0;
    }

    SECTION("negative grace period") {
        limits.grace_period = -1ms;
    }

    auto limiter = ResourceLimiter::prepare(limits);

    REQUIRE_FALSE(limiter);
    REQUIRE(limiter.error() == ErrorKind::BadArgument);
}

TEST_CASE("rlimit table for typical limits") {
    ResourceLimits limits{
        .time_limit = 1500ms,
        .memory_limit = 32 * MiB,
        .output_limit = 4 * MiB,
        .memory_slack = 8 * MiB,
    };

    auto limiter = ResourceLimiter::prepare(limits);
    REQUIRE(limiter);

    auto as = find_entry(*limiter, RLIMIT_AS);
    REQUIRE(as);
    REQUIRE(as->rlim_cur == 40 * MiB);
    REQUIRE(as->rlim_max == 40 * MiB);

    auto cpu = find_entry(*limiter, RLIMIT_CPU);
    REQUIRE(cpu);
    REQUIRE(cpu->rlim_cur == 3);
    REQUIRE(cpu->rlim_max == 4);

    auto fsize = find_entry(*limiter, RLIMIT_FSIZE);
    REQUIRE(fsize);
    REQUIRE(fsize->rlim_cur == 4 * MiB);

    auto core = find_entry(*limiter, RLIMIT_CORE);
    REQUIRE(core);
    REQUIRE(core->rlim_cur == 0);
    REQUIRE(core->rlim_max == 0);

    // Stack defaults to the memory limit
    auto stack = find_entry(*limiter, RLIMIT_STACK);
    REQUIRE(stack);
    REQUIRE(stack->rlim_cur == 32 * MiB);

    REQUIRE_FALSE(find_entry(*limiter, RLIMIT_NPROC));
}

TEST_CASE("Optional stack and process limits") {
    ResourceLimits limits{.stack_limit = 8 * MiB, .process_limit = 16};

    auto limiter = ResourceLimiter::prepare(limits);
    REQUIRE(limiter);

    REQUIRE(find_entry(*limiter, RLIMIT_STACK)->rlim_cur == 8 * MiB);

    auto nproc = find_entry(*limiter, RLIMIT_NPROC);
    REQUIRE(nproc);
    REQUIRE(nproc->rlim_cur == 16);
    REQUIRE(limiter->entries().size() == ResourceLimiter::MAX_ENTRIES);
}
