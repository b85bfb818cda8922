#include "user/batch_manifest.hpp"

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/expected.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>

#include <cstddef>
#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace judgebox {

namespace {

std::vector<std::string> split_fields(std::string_view line) {
    std::vector<std::string> fields;
    std::istringstream stream{std::string{line}};

    for (std::string field; stream >> field;) {
        fields.push_back(std::move(field));
    }

    return fields;
}

} // namespace

Expected<std::vector<BatchEntry>, std::string> parse_batch_manifest(std::string_view contents,
                                                                    const std::filesystem::path& base_dir) {
    std::vector<BatchEntry> entries;
    std::size_t line_num = 0;

    auto resolve = [&](const std::string& field) {
        std::filesystem::path path{field};
        return path.is_absolute() ? path : base_dir / path;
    };

    while (!contents.empty()) {
        auto end = contents.find('\n');
        std::string_view line = contents.substr(0, end);
        contents.remove_prefix(end == std::string_view::npos ? contents.size() : end + 1);
        ++line_num;

        auto fields = split_fields(line);

        if (fields.empty() || fields.front().starts_with('#')) {
            continue;
        }

        if (fields.size() != 3) {
            return fmt::format("manifest line {}: expected '<executable> <input> <expected>', got {} field(s)", line_num,
                               fields.size());
        }

        entries.push_back(BatchEntry{.name = fmt::format("{}", fmt::join(fields, " ")),
                                     .executable = resolve(fields[0]),
                                     .input_file = resolve(fields[1]),
                                     .expected_file = resolve(fields[2])});
    }

    if (entries.empty()) {
        return std::string{"manifest lists no submissions"};
    }

    return entries;
}

Expected<std::vector<BatchEntry>, std::string> read_batch_manifest(const std::filesystem::path& path) {
    auto contents = read_text_file(path);

    if (!contents) {
        return fmt::format("could not read '{}': {}", path, contents.error());
    }

    auto entries = parse_batch_manifest(*contents, path.parent_path());

    if (entries) {
        LOG_DEBUG("Read {} entries from {}", entries->size(), path);
    }

    return entries;
}

Expected<std::string> read_text_file(const std::filesystem::path& path) {
    static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

    int fd = TRY(linux::open(path.string(), O_RDONLY | O_CLOEXEC));
    auto close_fd = gsl::finally([fd] { std::ignore = linux::close(fd); });

    std::string contents;

    while (true) {
        auto chunk = linux::read(fd, CHUNK_SIZE);

        if (!chunk) {
            if (chunk.error() == std::errc::interrupted) {
                continue;
            }
            return chunk.error();
        }

        if (chunk->empty()) {
            break;
        }

        contents += *chunk;
    }

    return contents;
}

} // namespace judgebox
