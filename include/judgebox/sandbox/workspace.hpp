#pragma once

#include <judgebox/common/class_traits.hpp>
#include <judgebox/common/error_types.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace judgebox {

/// A private, freshly created directory that one run uses as its working directory.
///
/// The directory is removed recursively on destruction unless it was created with ``keep`` set.
class Workspace : NonCopyable
{
public:
    /// Creates ``<root>/judgebox-XXXXXX`` via mkdtemp(3)
    static Result<Workspace> create(const std::filesystem::path& root, bool keep = false);

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;
    ~Workspace();

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path file(std::string_view name) const { return path_ / name; }

    Result<void> write_file(std::string_view name, std::string_view contents) const;

    struct FileContents
    {
        std::string data;
        bool truncated = false;
    };

    /// Reads back at most ``max_bytes`` of ``name``.
    /// A missing file yields nullopt; anything other than a regular file is an ``ArtifactFailure``.
    Result<std::optional<FileContents>> read_file(std::string_view name, std::uint64_t max_bytes) const;

private:
    Workspace(std::filesystem::path path, bool keep)
        : path_{std::move(path)}
        , keep_{keep} {}

    void remove();

    std::filesystem::path path_;
    bool keep_ = false;
};

} // namespace judgebox
