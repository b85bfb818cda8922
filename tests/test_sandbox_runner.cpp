#include "catch2_custom.hpp"

#include "fake_backend.hpp"

#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/execution_result.hpp>
#include <judgebox/sandbox/sandbox_config.hpp>
#include <judgebox/sandbox/sandbox_runner.hpp>
#include <judgebox/sandbox/submission.hpp>

#include <catch2/generators/catch_generators.hpp>
#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
using judgebox::ErrorKind;
using judgebox::ExitStatus;
using judgebox::IoMode;
using judgebox::KillReason;
using judgebox::SandboxConfig;
using judgebox::SandboxRunner;
using judgebox::Submission;

namespace {

judgebox::ResourceLimits quick_limits() {
    return {.time_limit = 500ms, .memory_limit = 256ULL * 1024 * 1024, .grace_period = 250ms};
}

Submission make_submission(std::string_view fixture_name, std::string input = "5\n",
                           IoMode io_mode = IoMode::Stdio) {
    return {.executable = fixture(fixture_name),
            .args = {},
            .input = std::move(input),
            .limits = quick_limits(),
            .io_mode = io_mode};
}

SandboxConfig config_under(const TempDir& root) {
    SandboxConfig config;
    config.sandbox_root = root.path();
    return config;
}

} // namespace

TEST_CASE("Run a well-behaved program over stdio") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    auto result = runner.run(make_submission("correct_stdio", "42\n"));
    REQUIRE(result);

    REQUIRE(result->status.is_clean_exit());
    REQUIRE(result->kill_reason == KillReason::None);
    REQUIRE(result->stdout_data == "correct 42\n");
    REQUIRE(result->stderr_data.empty());
    REQUIRE_FALSE(result->output_file);
    REQUIRE_FALSE(result->output_truncated);
    REQUIRE_FALSE(result->memory_limit_hit);
    REQUIRE(result->answer() == "correct 42\n");
    REQUIRE(result->limits == quick_limits());

    // The workspace is gone once the run is over
    REQUIRE(root.entry_count() == 0);
}

TEST_CASE("Run a program over files") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    SECTION("output file is read back") {
        auto result = runner.run(make_submission("correct_fileio", "17\n", IoMode::File));
        REQUIRE(result);
        REQUIRE(result->status.is_clean_exit());
        REQUIRE(result->output_file == "correct 17\n");
        REQUIRE(result->answer() == "correct 17\n");
    }

    SECTION("no output file is an empty answer") {
        // Reads stdin, which is empty in file mode
        auto result = runner.run(make_submission("correct_stdio", "17\n", IoMode::File));
        REQUIRE(result);
        REQUIRE(result->status == ExitStatus::make_exited(1));
        REQUIRE(result->output_file == "");
        REQUIRE(result->answer().empty());
    }

    REQUIRE(root.entry_count() == 0);
}

TEST_CASE("Kept workspaces hold the program's files") {
    TempDir root;
    SandboxConfig config = config_under(root);
    config.keep_sandbox = true;

    SandboxRunner runner{config};

    auto result = runner.run(make_submission("correct_fileio", "3\n", IoMode::File));
    REQUIRE(result);
    REQUIRE(root.entry_count() == 1);

    auto workspace = std::filesystem::directory_iterator{root.path()}->path();
    REQUIRE(std::filesystem::exists(workspace / Submission::INPUT_FILE_NAME));
    REQUIRE(std::filesystem::exists(workspace / Submission::OUTPUT_FILE_NAME));
}

TEST_CASE("Exit codes and signals are reported as they happened") {
    SandboxRunner runner;

    SECTION("non-zero exit code") {
        auto result = runner.run(make_submission("nonzero_return", "8\n"));
        REQUIRE(result);
        REQUIRE(result->status == ExitStatus::make_exited(3));
        REQUIRE(result->stdout_data == "correct 8\n");
        REQUIRE(result->kill_reason == KillReason::None);
    }

    SECTION("abort") {
        auto result = runner.run(make_submission("crash_abort"));
        REQUIRE(result);
        REQUIRE(result->status.is_signal(SIGABRT));
        REQUIRE(result->stderr_data.starts_with("fatal: giving up"));
        REQUIRE(result->kill_reason == KillReason::None);
    }
}

TEST_CASE("Runaway programs are stopped at the deadline") {
    SandboxRunner runner;

    auto fixture_name = GENERATE(as<std::string>{}, "timeout_sleep", "timeout_cputime", "fork_spinner");
    CAPTURE(fixture_name);

    auto submission = make_submission(fixture_name);
    auto result = runner.run(submission);
    REQUIRE(result);

    REQUIRE(result->kill_reason == KillReason::WallTimeout);
    REQUIRE(result->status.is_signal(SIGKILL));
    REQUIRE(result->wall_time >= submission.limits.deadline());
    REQUIRE(result->wall_time < runaway_bound(submission.limits.deadline()));
}

TEST_CASE("Output past the limit is cut off and the program killed") {
    SandboxRunner runner;

    auto submission = make_submission("output_flood");
    submission.limits.output_limit = 64 * 1024;

    auto result = runner.run(submission);
    REQUIRE(result);

    REQUIRE(result->output_truncated);
    REQUIRE(result->kill_reason == KillReason::OutputLimit);
    REQUIRE(result->stdout_data.size() == submission.limits.output_limit);
    REQUIRE(result->stdout_data.starts_with("correct "));
}

TEST_CASE("A stop request cancels the run") {
    SandboxRunner runner;

    auto submission = make_submission("timeout_sleep");
    submission.limits.time_limit = 30s;

    std::stop_source stop_source;
    std::jthread canceller{[&stop_source] {
        std::this_thread::sleep_for(200ms);
        stop_source.request_stop();
    }};

    auto result = runner.run(submission, stop_source.get_token());
    REQUIRE(result);

    REQUIRE(result->kill_reason == KillReason::Cancelled);
    REQUIRE(result->wall_time < 5s);
}

TEST_CASE("Invalid limits are rejected before any workspace exists") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    auto submission = make_submission("correct_stdio");
    submission.limits.memory_limit = 0;

    auto result = runner.run(submission);

    REQUIRE_FALSE(result);
    REQUIRE(result.error() == ErrorKind::BadArgument);
    REQUIRE(root.entry_count() == 0);
}

TEST_CASE("A missing executable fails to spawn") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    auto submission = make_submission("correct_stdio");
    submission.executable = root.path() / "no_such_program";

    auto result = runner.run(submission);

    REQUIRE_FALSE(result);
    REQUIRE(result.error() == ErrorKind::SpawnFailure);
    REQUIRE(root.entry_count() == 0);
}

TEST_CASE("Programs see a minimal environment and their workspace") {
    auto script = std::make_shared<FakeScript>();
    script->stdout_data = "correct 1\n";

    TempDir root;
    SandboxRunner runner{config_under(root), make_fake_factory(script)};

    auto submission = make_submission("correct_stdio");
    submission.args = {"--fast", "x"};

    auto result = runner.run(submission);
    REQUIRE(result);
    REQUIRE(result->stdout_data == "correct 1\n");

    REQUIRE(script->last_request);
    const auto& request = *script->last_request;

    REQUIRE(request.executable == submission.executable);
    REQUIRE(request.args == submission.args);
    REQUIRE(request.env == SandboxRunner::child_environment());
    REQUIRE(request.env == std::vector<std::string>{"PATH=/usr/bin:/bin"});
    REQUIRE(request.working_dir.parent_path() == root.path());
    REQUIRE(request.sandbox_root == root.path());
    REQUIRE(request.stdin_path == request.working_dir / SandboxRunner::STDIN_FILE_NAME);
}

TEST_CASE("File mode programs get /dev/null on stdin") {
    auto script = std::make_shared<FakeScript>();
    SandboxRunner runner{{}, make_fake_factory(script)};

    auto result = runner.run(make_submission("correct_fileio", "1\n", IoMode::File));
    REQUIRE(result);

    REQUIRE(script->last_request->stdin_path == "/dev/null");
    REQUIRE(result->output_file == "");
}

TEST_CASE("A program that cannot be reaped is a timeout, not a verdict") {
    auto script = std::make_shared<FakeScript>();
    script->hang = true;

    SandboxConfig config;
    config.reap_timeout = 50ms;

    SandboxRunner runner{config, make_fake_factory(script)};

    auto submission = make_submission("correct_stdio");
    submission.limits.time_limit = 50ms;
    submission.limits.grace_period = 0ms;

    auto result = runner.run(submission);

    REQUIRE_FALSE(result);
    REQUIRE(result.error() == ErrorKind::TimedOut);
    REQUIRE(script->kill_calls == 1);
}

TEST_CASE("Programs are stopped from reaching outside their workspace") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    // Another run's workspace under the same root
    const auto victim = root.path() / "judgebox-other" / Submission::OUTPUT_FILE_NAME;
    std::filesystem::create_directory(victim.parent_path());
    std::ofstream{victim} << "correct 7\n";

    auto input = GENERATE_COPY(fmt::format("write {}\n", victim.string()), fmt::format("read {}\n", victim.string()),
                               fmt::format("symlink {}\n", victim.string()),
                               std::string{"write ../judgebox-other/output.txt\n"},
                               fmt::format("signal {}\n", ::getpid()), std::string{"signal 1\n"});
    CAPTURE(input);

    auto result = runner.run(make_submission("escape_workspace", input));
    REQUIRE(result);

    REQUIRE(result->kill_reason == KillReason::ForbiddenAccess);
    REQUIRE(result->status.is_signal(SIGKILL));
    REQUIRE(result->violation);
    REQUIRE(result->stdout_data.empty());

    std::ifstream victim_file{victim};
    std::string contents{std::istreambuf_iterator<char>{victim_file}, std::istreambuf_iterator<char>{}};
    REQUIRE(contents == "correct 7\n");

    // Only the other workspace is left
    REQUIRE(root.entry_count() == 1);
}

TEST_CASE("Forbidden accesses name what was refused") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    const auto victim = root.path() / "judgebox-other" / Submission::OUTPUT_FILE_NAME;
    std::filesystem::create_directory(victim.parent_path());
    std::ofstream{victim} << "correct 7\n";

    auto result = runner.run(make_submission("escape_workspace", fmt::format("write {}\n", victim.string())));
    REQUIRE(result);

    REQUIRE(result->violation == fmt::format("write access to '{}'", std::filesystem::canonical(victim).string()));
}

TEST_CASE("Confined programs can still do their job") {
    TempDir root;
    SandboxRunner runner{config_under(root)};

    auto input = GENERATE(as<std::string>{}, "write scratch.txt\n", "write /dev/null\n", "read /dev/null\n",
                          "read /proc/self/status\n", "signal 0\n");
    CAPTURE(input);

    auto result = runner.run(make_submission("escape_workspace", input));
    REQUIRE(result);

    REQUIRE(result->status.is_clean_exit());
    REQUIRE(result->kill_reason == KillReason::None);
    REQUIRE_FALSE(result->violation);
    REQUIRE(result->stdout_data == "correct 1\n");
}

TEST_CASE("A forbidden access reported by the backend kills the run") {
    auto script = std::make_shared<FakeScript>();
    script->violation = "signal to pid 1 outside the sandbox (syscall 62)";
    script->status = ExitStatus::make_signaled(SIGKILL);

    SandboxRunner runner{{}, make_fake_factory(script)};

    auto result = runner.run(make_submission("correct_stdio"));
    REQUIRE(result);

    REQUIRE(result->kill_reason == KillReason::ForbiddenAccess);
    REQUIRE(result->violation == script->violation);
    REQUIRE(script->kill_calls == 1);
}
