#include <judgebox/sandbox/path_policy.hpp>

#include <judgebox/logging.hpp>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string_view>
#include <system_error>

namespace judgebox {

namespace {

std::filesystem::path canonical_or_normal(const std::filesystem::path& path) {
    std::error_code err;
    auto canonical = std::filesystem::weakly_canonical(std::filesystem::absolute(path, err), err);

    if (err) {
        LOG_DEBUG("Could not canonicalize {:?}: '{}'", path, err);
        return path.lexically_normal();
    }

    return canonical;
}

} // namespace

PathPolicy::PathPolicy(const std::filesystem::path& workspace, const std::filesystem::path& sandbox_root)
    : workspace_{canonical_or_normal(workspace)}
    , sandbox_root_{canonical_or_normal(sandbox_root)} {}

bool PathPolicy::is_within(const std::filesystem::path& path, const std::filesystem::path& dir) {
    // A trailing separator shows up as an empty last element
    auto dir_end = dir.end();
    if (dir_end != dir.begin() && std::prev(dir_end)->empty()) {
        --dir_end;
    }

    auto [dir_it, path_it] = std::mismatch(dir.begin(), dir_end, path.begin(), path.end());

    return dir_it == dir_end;
}

bool PathPolicy::allows(const std::filesystem::path& resolved, FileAccess access) const {
    if (is_within(resolved, workspace_)) {
        return true;
    }

    if (is_within(resolved, sandbox_root_)) {
        return false;
    }

    if (access == FileAccess::Write) {
        return std::ranges::find(WRITABLE_DEVICES, resolved.native()) != WRITABLE_DEVICES.end();
    }

    return true;
}

} // namespace judgebox
