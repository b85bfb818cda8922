#pragma once

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/expected.hpp>
#include <judgebox/common/extra_formatters.hpp>
#include <judgebox/judge/checker.hpp>
#include <judgebox/judge/judge_engine.hpp>
#include <judgebox/sandbox/resource_limits.hpp>
#include <judgebox/sandbox/sandbox_config.hpp>
#include <judgebox/sandbox/submission.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace judgebox {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for cli output. See ``VerbosityLevel``.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // Single submission mode
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> input_file;
    std::optional<std::filesystem::path> expected_file;

    // Batch mode
    std::optional<std::filesystem::path> batch_file;
    std::size_t jobs = DEFAULT_JOBS;

    ResourceLimits limits;
    IoMode io_mode = IoMode::Stdio;

    CheckerKind checker_kind = CheckerKind::Exact;
    CheckerOptions checker_options;

    std::filesystem::path sandbox_root = SandboxConfig::default_sandbox_root();
    bool keep_sandbox = false;
    int max_attempts = JudgeConfig::DEFAULT_MAX_ATTEMPTS;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;
    static constexpr std::size_t DEFAULT_JOBS = 1;

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    bool is_batch() const { return batch_file.has_value(); }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() {
        // Verbosity is adjusted with repeated -v/-q, so just clamp it to [MIN, MAX]
        verbosity = std::clamp(verbosity, VerbosityLevel::Silent, VerbosityLevel::Max);

        if (batch_file.has_value() == !executable.empty()) {
            return std::string{"Exactly one of an executable or --batch must be given"};
        }

        if (batch_file) {
            TRY(ensure_is_regular_file(*batch_file, "Batch manifest '{}'"));
        } else {
            TRY(ensure_is_regular_file(executable, "Executable '{}'"));

            if (!expected_file) {
                return std::string{"--expected is required when judging a single executable"};
            }
        }

        if (input_file) {
            TRY(ensure_is_regular_file(*input_file, "Input file '{}'"));
        }

        if (expected_file) {
            TRY(ensure_is_regular_file(*expected_file, "Expected answer file '{}'"));
        }

        TRY(ensure_is_directory(sandbox_root, "Sandbox root '{}'"));

        if (limits.time_limit.count() <= 0 || limits.memory_limit == 0 || limits.output_limit == 0) {
            return std::string{"Time, memory and output limits must be positive"};
        }

        if (!(checker_options.tolerance >= 0.0) || !std::isfinite(checker_options.tolerance)) {
            return fmt::format("Tolerance {} is not a non-negative number", checker_options.tolerance);
        }

        if (!(checker_options.partial_score >= 0.0 && checker_options.partial_score <= 1.0)) {
            return fmt::format("Partial score {} is not within [0, 1]", checker_options.partial_score);
        }

        if (max_attempts < 1 || jobs < 1) {
            return std::string{"--attempts and --jobs must be at least 1"};
        }

        return {};
    }

    JudgeConfig judge_config() const {
        return {.checker_kind = checker_kind,
                .checker_options = checker_options,
                .max_attempts = max_attempts,
                .retry_backoff = JudgeConfig::DEFAULT_RETRY_BACKOFF};
    }

    SandboxConfig sandbox_config() const {
        SandboxConfig config;
        config.sandbox_root = sandbox_root;
        config.keep_sandbox = keep_sandbox;
        return config;
    }
};

} // namespace judgebox

template <>
struct fmt::formatter<::judgebox::ProgramOptions> : ::judgebox::DebugFormatter
{
    auto format(const ::judgebox::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, color_opt={}, executable={}, batch={}, jobs={}, limits={}, io_mode={}, "
                              "checker={}, sandbox_root={}, keep_sandbox={}, attempts={}}}",
                              fmt::underlying(from.verbosity), fmt::underlying(from.colorize_option), from.executable,
                              from.batch_file, from.jobs, from.limits, from.io_mode, from.checker_kind,
                              from.sandbox_root, from.keep_sandbox, from.max_attempts);
    }
};
