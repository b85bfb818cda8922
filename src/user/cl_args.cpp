#include "user/cl_args.hpp"

#include <judgebox/common/expected.hpp>
#include <judgebox/judge/checker.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/submission.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace judgebox {

Expected<std::uint64_t, std::string> parse_byte_size(std::string_view str) {
    std::uint64_t multiplier = 1;

    if (!str.empty() && std::isalpha(static_cast<unsigned char>(str.back())) != 0) {
        switch (std::toupper(static_cast<unsigned char>(str.back()))) {
        case 'K':
            multiplier = 1ULL << 10;
            break;
        case 'M':
            multiplier = 1ULL << 20;
            break;
        case 'G':
            multiplier = 1ULL << 30;
            break;
        default:
            return fmt::format("'{}' has an unknown size suffix (expected K, M or G)", str);
        }
        str.remove_suffix(1);
    }

    std::uint64_t value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (str.empty() || ec != std::errc{} || ptr != str.data() + str.size()) {
        return fmt::format("'{}' is not a valid size", str);
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return fmt::format("'{}' is too large", str);
    }

    return value * multiplier;
}

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ JUDGEBOX_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

template <typename T>
T parse_number_or_throw(const std::string& opt, std::string_view what) {
    T value{};
    auto [ptr, ec] = std::from_chars(opt.data(), opt.data() + opt.size(), value);

    if (opt.empty() || ec != std::errc{} || ptr != opt.data() + opt.size()) {
        throw std::invalid_argument(fmt::format("{} '{}' is not a valid number", what, opt));
    }

    return value;
}

std::uint64_t parse_size_or_throw(const std::string& opt, std::string_view what) {
    auto size = parse_byte_size(opt);

    if (!size) {
        throw std::invalid_argument(fmt::format("{}: {}", what, size.error()));
    }

    return size.value();
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("judgebox v{}: runs a program under resource limits and judges its answer",
                                            JUDGEBOX_VERSION_STRING));

    // FIXME: argparse behavior is dependant upon ORDER of chained fn calls.

    // clang-format off
    arg_parser_.add_argument("executable")
        .nargs(argparse::nargs_pattern::optional)
        .action([this] (const std::string& opt) {
                opts_buffer_.executable = opt;
        })
        .help("The program to judge. Omit when using --batch.");

    arg_parser_.add_argument("args")
        .remaining()
        .help("Arguments passed to the program");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", JUDGEBOX_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-i", "--input")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.input_file = opt;
        })
        .help("File whose contents are the program's input (default: empty)");

    arg_parser_.add_argument("-e", "--expected")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.expected_file = opt;
        })
        .help("File holding the expected answer");

    arg_parser_.add_argument("-t", "--time-limit")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.time_limit = std::chrono::milliseconds{parse_number_or_throw<std::int64_t>(opt, "Time limit")};
        })
        .help(fmt::format("Time limit in milliseconds (default: {})", ResourceLimits::DEFAULT_TIME_LIMIT.count()));

    arg_parser_.add_argument("-m", "--memory-limit")
        .metavar("SIZE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.memory_limit = parse_size_or_throw(opt, "Memory limit");
        })
        .help("Memory limit in bytes, or with a K/M/G suffix (default: 256M)");

    arg_parser_.add_argument("-o", "--output-limit")
        .metavar("SIZE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.output_limit = parse_size_or_throw(opt, "Output limit");
        })
        .help("Output limit in bytes, or with a K/M/G suffix (default: 64M)");

    arg_parser_.add_argument("--grace")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.limits.grace_period = std::chrono::milliseconds{parse_number_or_throw<std::int64_t>(opt, "Grace period")};
        })
        .help(fmt::format("Extra wall-clock time before a slow program is killed (default: {}ms)",
                          ResourceLimits::DEFAULT_GRACE_PERIOD.count()));

    arg_parser_.add_argument("--io-mode")
        .choices("stdio", "file")
        .default_value(std::string{"stdio"})
        .metavar("MODE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.io_mode = opt == "file" ? IoMode::File : IoMode::Stdio;
        })
        .help("stdio: input on stdin, answer on stdout. file: input.txt and output.txt in the working directory");

    arg_parser_.add_argument("--checker")
        .choices("exact", "tolerance", "partial", "white-diff")
        .default_value(std::string{"exact"})
        .metavar("KIND")
        .nargs(1)
        .action([this] (const std::string& opt) {
                using enum CheckerKind;

                if (opt == "exact") {
                    opts_buffer_.checker_kind = Exact;
                } else if (opt == "tolerance") {
                    opts_buffer_.checker_kind = Tolerance;
                } else if (opt == "partial") {
                    opts_buffer_.checker_kind = Partial;
                } else if (opt == "white-diff") {
                    opts_buffer_.checker_kind = WhiteDiff;
                }
        })
        .help("How the answer is compared against the expected one");

    arg_parser_.add_argument("--label")
        .metavar("TEXT")
        .nargs(1)
        .action([this] (const std::string& opt) {
                if (opt.empty() || opt.find_first_of(" \t\n") != std::string::npos) {
                    throw std::invalid_argument(fmt::format("Label '{}' must be a single non-empty word", opt));
                }
                opts_buffer_.checker_options.label = opt;
        })
        .help(fmt::format("Label that must precede the answer (default: {})", ExactChecker::DEFAULT_LABEL));

    arg_parser_.add_argument("--tolerance")
        .metavar("EPS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.checker_options.tolerance = parse_number_or_throw<double>(opt, "Tolerance");
        })
        .help(fmt::format("Relative/absolute tolerance of the tolerance checker (default: {})",
                          ToleranceChecker::DEFAULT_TOLERANCE));

    arg_parser_.add_argument("--partial-score")
        .metavar("FRACTION")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.checker_options.partial_score = parse_number_or_throw<double>(opt, "Partial score");
        })
        .help(fmt::format("Score of a well-formed but wrong answer with the partial checker (default: {})",
                          PartialCreditChecker::DEFAULT_PARTIAL_SCORE));

    arg_parser_.add_argument("--sandbox-root")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.sandbox_root = opt;
        })
        .help("Directory in which per-run workspaces are created (default: $TMPDIR or /tmp)");

    arg_parser_.add_argument("--keep-sandbox")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.keep_sandbox = true;
        })
        .help("Do not remove workspaces after the run");

    arg_parser_.add_argument("--attempts")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.max_attempts = parse_number_or_throw<int>(opt, "Attempt count");
        })
        .help(fmt::format("Tries for a program that fails to start (default: {})", JudgeConfig::DEFAULT_MAX_ATTEMPTS));

    arg_parser_.add_argument("--batch")
        .metavar("FILE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.batch_file = opt;
        })
        .help("Manifest with one '<executable> <input file> <expected file>' per line");

    arg_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.jobs = parse_number_or_throw<std::size_t>(opt, "Job count");
        })
        .help("Number of submissions judged concurrently with --batch");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (value > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (value < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    opts_buffer_ = {};

    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    if (auto extra = arg_parser_.present<std::vector<std::string>>("args")) {
        opts_buffer_.args = std::move(*extra);
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace judgebox
