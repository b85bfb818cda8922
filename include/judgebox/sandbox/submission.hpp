#pragma once

#include <judgebox/common/extra_formatters.hpp>
#include <judgebox/sandbox/resource_limits.hpp>

#include <boost/describe/enum.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace judgebox {

enum class IoMode {
    Stdio, ///< Input is fed on stdin, the answer is read from stdout
    File,  ///< Input is placed in ``input.txt``, the answer is read back from ``output.txt``
};

BOOST_DESCRIBE_ENUM(IoMode, Stdio, File);

/// One program to be judged, with everything needed to run it.
/// Only ever passed around by const reference once built.
struct Submission
{
    static constexpr std::string_view INPUT_FILE_NAME = "input.txt";
    static constexpr std::string_view OUTPUT_FILE_NAME = "output.txt";

    std::filesystem::path executable;

    /// Passed after argv[0]
    std::vector<std::string> args;

    std::string input;

    ResourceLimits limits;

    IoMode io_mode = IoMode::Stdio;
};

} // namespace judgebox
