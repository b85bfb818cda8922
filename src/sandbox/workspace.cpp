#include <judgebox/sandbox/workspace.hpp>

#include <judgebox/common/error_types.hpp>
#include <judgebox/common/linux.hpp>
#include <judgebox/logging.hpp>

#include <gsl/util>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <ios>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace judgebox {

Result<Workspace> Workspace::create(const std::filesystem::path& root, bool keep) {
    std::error_code abs_err;
    std::filesystem::path abs_root = std::filesystem::absolute(root, abs_err);

    if (abs_err) {
        LOG_ERROR("Could not resolve sandbox root {}: '{}'", root, abs_err);
        return ErrorKind::ArtifactFailure;
    }

    std::string tmpl = (abs_root / "judgebox-XXXXXX").string();
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    if (::mkdtemp(buffer.data()) == nullptr) {
        LOG_ERROR("Failed to create workspace under {}: '{}'", root, linux::make_error_code());
        return ErrorKind::ArtifactFailure;
    }

    std::filesystem::path path{buffer.data()};
    LOG_DEBUG("Created workspace {}", path);

    return Workspace{std::move(path), keep};
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})}
    , keep_{other.keep_} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
        keep_ = rhs.keep_;
    }

    return *this;
}

Workspace::~Workspace() {
    remove();
}

void Workspace::remove() {
    // empty if moved-from
    if (path_.empty()) {
        return;
    }

    if (keep_) {
        LOG_INFO("Keeping workspace {}", path_);
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove workspace {}: '{}'", path_, err);
    }

    path_.clear();
}

Result<void> Workspace::write_file(std::string_view name, std::string_view contents) const {
    std::ofstream out{file(name), std::ios::binary | std::ios::trunc};

    out.write(contents.data(), gsl::narrow_cast<std::streamsize>(contents.size()));
    out.close();

    if (!out) {
        LOG_ERROR("Failed to write {} bytes to {}", contents.size(), file(name));
        return ErrorKind::ArtifactFailure;
    }

    return {};
}

Result<std::optional<Workspace::FileContents>> Workspace::read_file(std::string_view name,
                                                                    std::uint64_t max_bytes) const {
    const std::filesystem::path path = file(name);

    std::error_code err;
    const auto status = std::filesystem::symlink_status(path, err);

    if (status.type() == std::filesystem::file_type::not_found) {
        return std::optional<FileContents>{};
    }

    if (err || status.type() != std::filesystem::file_type::regular) {
        LOG_ERROR("{} is not a regular file (type={}, err='{}')", path, fmt::underlying(status.type()), err);
        return ErrorKind::ArtifactFailure;
    }

    const std::uint64_t size = std::filesystem::file_size(path, err);

    if (err) {
        LOG_ERROR("Could not stat {}: '{}'", path, err);
        return ErrorKind::ArtifactFailure;
    }

    FileContents contents;
    contents.truncated = size > max_bytes;
    contents.data.resize(gsl::narrow_cast<std::size_t>(std::min(size, max_bytes)));

    std::ifstream in{path, std::ios::binary};
    in.read(contents.data.data(), gsl::narrow_cast<std::streamsize>(contents.data.size()));

    if (!in) {
        LOG_ERROR("Failed to read {} bytes from {}", contents.data.size(), path);
        return ErrorKind::ArtifactFailure;
    }

    return std::optional{std::move(contents)};
}

} // namespace judgebox
