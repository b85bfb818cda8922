#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <filesystem>

namespace judgebox {

/// Knobs for how runs are isolated and supervised; the same for every submission
struct SandboxConfig
{
    static constexpr std::size_t DEFAULT_STDERR_LIMIT = 64 * 1024;
    static constexpr std::chrono::milliseconds DEFAULT_POLL_PERIOD{5};
    static constexpr std::chrono::milliseconds DEFAULT_REAP_TIMEOUT{2000};

    /// Parent directory of every per-run workspace
    std::filesystem::path sandbox_root = default_sandbox_root();

    /// Leave workspaces on disk after the run, for inspection
    bool keep_sandbox = false;

    /// Captured stderr beyond this is dropped silently
    std::size_t stderr_limit = DEFAULT_STDERR_LIMIT;

    /// Upper bound on how long the supervisor sleeps between checks
    std::chrono::milliseconds poll_period = DEFAULT_POLL_PERIOD;

    /// How long to wait for a killed process to be reaped before giving up on it
    std::chrono::milliseconds reap_timeout = DEFAULT_REAP_TIMEOUT;

    /// $TMPDIR if set, otherwise /tmp
    static std::filesystem::path default_sandbox_root() {
        // NOLINTNEXTLINE(concurrency-mt-unsafe)
        const char* tmpdir = std::getenv("TMPDIR");
        return tmpdir != nullptr && *tmpdir != '\0' ? std::filesystem::path{tmpdir} : std::filesystem::path{"/tmp"};
    }
};

} // namespace judgebox
