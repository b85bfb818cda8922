#include "catch2_custom.hpp"

#include <judgebox/judge/checker.hpp>
#include <judgebox/sandbox/submission.hpp>

#include "output/verbosity.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using judgebox::CommandLineArgs;
using judgebox::Expected;
using judgebox::ProgramOptions;
using judgebox::VerbosityLevel;

namespace {

Expected<ProgramOptions, std::string> parse(std::vector<std::string> args) {
    args.insert(args.begin(), "/usr/local/bin/judgebox");

    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

/// An expected answer (and an input) on disk, plus a program to judge
struct CliFiles
{
    TempDir dir;
    std::string expected = (dir.path() / "expected.txt").string();
    std::string input = (dir.path() / "input.txt").string();
    std::string executable = fixture("correct_stdio").string();

    CliFiles() {
        std::ofstream{expected} << "correct 5\n";
        std::ofstream{input} << "5\n";
    }
};

} // namespace

TEST_CASE("Byte sizes with suffixes") {
    using judgebox::parse_byte_size;

    REQUIRE(parse_byte_size("0") == 0U);
    REQUIRE(parse_byte_size("1024") == 1024U);
    REQUIRE(parse_byte_size("4K") == 4096U);
    REQUIRE(parse_byte_size("4k") == 4096U);
    REQUIRE(parse_byte_size("256M") == 256ULL * 1024 * 1024);
    REQUIRE(parse_byte_size("2G") == 2ULL * 1024 * 1024 * 1024);

    REQUIRE(parse_byte_size("12X") == std::string{"'12X' has an unknown size suffix (expected K, M or G)"});
    REQUIRE(parse_byte_size("") == std::string{"'' is not a valid size"});
    REQUIRE(parse_byte_size("M") == std::string{"'' is not a valid size"});
    REQUIRE(parse_byte_size("-5") == std::string{"'-5' is not a valid size"});
    REQUIRE(parse_byte_size("1.5M") == std::string{"'1.5' is not a valid size"});
    REQUIRE(parse_byte_size("99999999999G") == std::string{"'99999999999' is too large"});
}

TEST_CASE("Single submission with every option") {
    CliFiles files;

    auto opts = parse({"-e", files.expected, "-i", files.input, "-t", "1500", "-m", "64M", "-o", "1K", "--grace", "100",
                       "--io-mode", "file", "--checker", "partial", "--partial-score", "0.25", "--label", "answer",
                       "--attempts", "5", "--keep-sandbox", "--sandbox-root", files.dir.path().string(), "-v",
                       files.executable, "first", "second"});

    REQUIRE(opts);

    REQUIRE(opts->executable == files.executable);
    REQUIRE(opts->args == std::vector<std::string>{"first", "second"});
    REQUIRE(opts->expected_file == files.expected);
    REQUIRE(opts->input_file == files.input);
    REQUIRE_FALSE(opts->is_batch());

    REQUIRE(opts->limits.time_limit == 1500ms);
    REQUIRE(opts->limits.memory_limit == 64ULL * 1024 * 1024);
    REQUIRE(opts->limits.output_limit == 1024U);
    REQUIRE(opts->limits.grace_period == 100ms);
    REQUIRE(opts->io_mode == judgebox::IoMode::File);

    REQUIRE(opts->checker_kind == judgebox::CheckerKind::Partial);
    REQUIRE(opts->checker_options.partial_score == 0.25);
    REQUIRE(opts->checker_options.label == "answer");

    REQUIRE(opts->max_attempts == 5);
    REQUIRE(opts->keep_sandbox);
    REQUIRE(opts->sandbox_root == files.dir.path());
    REQUIRE(opts->verbosity == VerbosityLevel::All);

    auto judge_config = opts->judge_config();
    REQUIRE(judge_config.max_attempts == 5);
    REQUIRE(judge_config.checker_kind == judgebox::CheckerKind::Partial);

    auto sandbox_config = opts->sandbox_config();
    REQUIRE(sandbox_config.keep_sandbox);
    REQUIRE(sandbox_config.sandbox_root == files.dir.path());
}

TEST_CASE("Defaults") {
    CliFiles files;

    auto opts = parse({"-e", files.expected, files.executable});

    REQUIRE(opts);
    REQUIRE(opts->args.empty());
    REQUIRE_FALSE(opts->input_file);
    REQUIRE(opts->limits == judgebox::ResourceLimits{});
    REQUIRE(opts->io_mode == judgebox::IoMode::Stdio);
    REQUIRE(opts->checker_kind == judgebox::CheckerKind::Exact);
    REQUIRE(opts->verbosity == ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Auto);
    REQUIRE(opts->jobs == 1);
}

TEST_CASE("Batch mode") {
    CliFiles files;
    std::string manifest = (files.dir.path() / "manifest.txt").string();
    std::ofstream{manifest} << files.executable << ' ' << files.input << ' ' << files.expected << '\n';

    auto opts = parse({"--batch", manifest, "-j", "4", "-q", "--color", "never"});

    REQUIRE(opts);
    REQUIRE(opts->is_batch());
    REQUIRE(opts->batch_file == manifest);
    REQUIRE(opts->jobs == 4);
    REQUIRE(opts->verbosity == VerbosityLevel::Quiet);
    REQUIRE(opts->colorize_option == ProgramOptions::ColorizeOpt::Never);
}

TEST_CASE("Invalid command lines are reported") {
    CliFiles files;

    SECTION("nothing to judge") {
        REQUIRE(parse({"-e", files.expected}) == std::string{"Exactly one of an executable or --batch must be given"});
    }

    SECTION("both an executable and a batch") {
        REQUIRE(parse({"--batch", files.expected, "-e", files.expected, files.executable}) ==
                std::string{"Exactly one of an executable or --batch must be given"});
    }

    SECTION("no expected answer") {
        REQUIRE(parse({files.executable}) == std::string{"--expected is required when judging a single executable"});
    }

    SECTION("missing executable") {
        auto opts = parse({"-e", files.expected, (files.dir.path() / "nope").string()});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::EndsWith("does not exist"));
    }

    SECTION("missing input file") {
        auto opts = parse({"-e", files.expected, "-i", "/nonexistent/input.txt", files.executable});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::StartsWith("Input file"));
    }

    SECTION("malformed size") {
        auto opts = parse({"-e", files.expected, "-m", "12X", files.executable});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::ContainsSubstring("unknown size suffix"));
    }

    SECTION("malformed time limit") {
        auto opts = parse({"-e", files.expected, "-t", "fast", files.executable});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::ContainsSubstring("is not a valid number"));
    }

    SECTION("non-positive time limit") {
        REQUIRE(parse({"-e", files.expected, "-t", "0", files.executable}) ==
                std::string{"Time, memory and output limits must be positive"});
    }

    SECTION("unknown checker") {
        REQUIRE_FALSE(parse({"-e", files.expected, "--checker", "fuzzy", files.executable}));
    }

    SECTION("partial score out of range") {
        REQUIRE(parse({"-e", files.expected, "--partial-score", "1.5", files.executable}) ==
                std::string{"Partial score 1.5 is not within [0, 1]"});
    }

    SECTION("negative tolerance") {
        REQUIRE_FALSE(parse({"-e", files.expected, "--tolerance", "-1", files.executable}));
    }

    SECTION("label with spaces") {
        REQUIRE_FALSE(parse({"-e", files.expected, "--label", "two words", files.executable}));
    }

    SECTION("zero attempts") {
        REQUIRE(parse({"-e", files.expected, "--attempts", "0", files.executable}) ==
                std::string{"--attempts and --jobs must be at least 1"});
    }

    SECTION("too verbose") {
        REQUIRE_FALSE(parse({"-e", files.expected, "-v", "-v", "-v", files.executable}));
    }

    SECTION("sandbox root is not a directory") {
        auto opts = parse({"-e", files.expected, "--sandbox-root", files.expected, files.executable});
        REQUIRE_FALSE(opts);
        REQUIRE_THAT(opts.error(), Catch::Matchers::EndsWith("is not a directory"));
    }
}
