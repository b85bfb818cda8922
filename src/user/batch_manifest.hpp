#pragma once

#include <judgebox/common/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace judgebox {

/// One line of a batch manifest
struct BatchEntry
{
    /// The line as written, for display
    std::string name;

    std::filesystem::path executable;
    std::filesystem::path input_file;
    std::filesystem::path expected_file;
};

/// Parses ``<executable> <input file> <expected file>`` lines. Blank lines and lines starting
/// with '#' are skipped; relative paths are taken relative to ``base_dir``.
Expected<std::vector<BatchEntry>, std::string> parse_batch_manifest(std::string_view contents,
                                                                    const std::filesystem::path& base_dir);

Expected<std::vector<BatchEntry>, std::string> read_batch_manifest(const std::filesystem::path& path);

/// Entire contents of a (small) text file
Expected<std::string> read_text_file(const std::filesystem::path& path);

} // namespace judgebox
