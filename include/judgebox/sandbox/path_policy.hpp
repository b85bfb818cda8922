#pragma once

#include <judgebox/common/extra_formatters.hpp>

#include <boost/describe/enum.hpp>

#include <array>
#include <filesystem>
#include <string_view>

namespace judgebox {

enum class FileAccess { Read, Write };

BOOST_DESCRIBE_ENUM(FileAccess, Read, Write);

/// Which files a confined run may touch. Paths are judged after symlinks are resolved.
///
/// Rules, first match wins:
///   - anything inside the run's own workspace is allowed;
///   - anything else under the sandbox root (i.e. other runs' workspaces) is denied;
///   - writes are denied, except to the devices in ``WRITABLE_DEVICES``;
///   - reads are allowed.
class PathPolicy
{
public:
    /// Both directories are canonicalized so that they compare equal to resolved paths
    PathPolicy(const std::filesystem::path& workspace, const std::filesystem::path& sandbox_root);

    bool allows(const std::filesystem::path& resolved, FileAccess access) const;

    const std::filesystem::path& get_workspace() const { return workspace_; }

    const std::filesystem::path& get_sandbox_root() const { return sandbox_root_; }

    /// Whether ``path`` is ``dir`` or lies below it. Both must be absolute and normalized.
    static bool is_within(const std::filesystem::path& path, const std::filesystem::path& dir);

    static constexpr std::array<std::string_view, 2> WRITABLE_DEVICES{"/dev/null", "/dev/zero"};

private:
    std::filesystem::path workspace_;
    std::filesystem::path sandbox_root_;
};

} // namespace judgebox
