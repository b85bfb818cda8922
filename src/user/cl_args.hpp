#pragma once

#include <judgebox/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace judgebox {

/// Parse a byte count with an optional binary K, M or G suffix, e.g. "256M"
Expected<std::uint64_t, std::string> parse_byte_size(std::string_view str);

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace judgebox
