#include <judgebox/sandbox/resource_limits.hpp>

#include <judgebox/common/error_types.hpp>
#include <judgebox/logging.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>

#include <sys/resource.h>

namespace judgebox {

std::chrono::seconds ResourceLimiter::cpu_soft_limit(std::chrono::milliseconds time_limit) {
    return std::chrono::ceil<std::chrono::seconds>(time_limit) + std::chrono::seconds{1};
}

Result<ResourceLimiter> ResourceLimiter::prepare(const ResourceLimits& limits) {
    if (limits.time_limit <= std::chrono::milliseconds::zero()) {
        LOG_WARN("Rejecting non-positive time limit ({}ms)", limits.time_limit.count());
        return ErrorKind::BadArgument;
    }

    if (limits.memory_limit == 0 || limits.output_limit == 0) {
        LOG_WARN("Rejecting zero memory or output limit: {}", limits);
        return ErrorKind::BadArgument;
    }

    if (limits.grace_period < std::chrono::milliseconds::zero()) {
        LOG_WARN("Rejecting negative grace period ({}ms)", limits.grace_period.count());
        return ErrorKind::BadArgument;
    }

    ResourceLimiter limiter;

    const auto address_space = gsl::narrow_cast<rlim_t>(limits.address_space_limit());
    limiter.add(RLIMIT_AS, address_space, address_space);

    const auto cpu_soft = gsl::narrow_cast<rlim_t>(cpu_soft_limit(limits.time_limit).count());
    limiter.add(RLIMIT_CPU, cpu_soft, cpu_soft + 1);

    const auto output = gsl::narrow_cast<rlim_t>(limits.output_limit);
    limiter.add(RLIMIT_FSIZE, output, output);

    limiter.add(RLIMIT_CORE, 0, 0);

    const auto stack = gsl::narrow_cast<rlim_t>(limits.stack_limit.value_or(limits.memory_limit));
    limiter.add(RLIMIT_STACK, stack, stack);

    if (limits.process_limit) {
        const auto nproc = gsl::narrow_cast<rlim_t>(*limits.process_limit);
        limiter.add(RLIMIT_NPROC, nproc, nproc);
    }

    return limiter;
}

void ResourceLimiter::add(int resource, rlim_t soft, rlim_t hard) {
    ASSERT(num_entries_ < MAX_ENTRIES);

    entries_[num_entries_++] = Entry{.resource = resource, .value = {.rlim_cur = soft, .rlim_max = hard}};
}

int ResourceLimiter::install() const noexcept {
    for (const Entry& entry : entries()) {
        if (::setrlimit(entry.resource, &entry.value) != 0) {
            return errno;
        }
    }

    return 0;
}

} // namespace judgebox
