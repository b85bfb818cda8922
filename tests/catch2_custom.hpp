#pragma once

#include <judgebox/common/extra_formatters.hpp> // IWYU pragma: keep
#include <judgebox/judge/verdict.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <stdlib.h> // mkdtemp

// If this is included after Catch2, then instantiations of the stringify function template will
// be choosen over ours
#if defined(CATCH_TOSTRING_HPP_INCLUDED)
#error "Include this file before Catch2"
#else
// Hacky way of overriding the stringification behavior for types Catch2 explicitly specializes
// String formatting without being able to see non-graphical chars is VERY annoying
namespace Catch::Detail {

inline std::string stringify(std::string_view e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const std::string& e) {
    return fmt::format("{:?}", e);
}

inline std::string stringify(const char* e) {
    return fmt::format("{:?}", std::string_view{e});
}

} // namespace Catch::Detail
#endif

#include <catch2/catch_test_macros.hpp> // IWYU pragma: export
#include <catch2/catch_tostring.hpp>
#include <catch2/matchers/catch_matchers_all.hpp> // IWYU pragma: export

namespace Catch {

template <::judgebox::DescribedEnum Enum>
struct StringMaker<Enum>
{
    static std::string convert(Enum e) { return fmt::format("{:?}", e); }
};

template <>
struct StringMaker<::judgebox::Verdict>
{
    static std::string convert(const ::judgebox::Verdict& verdict) { return fmt::format("{:?}", verdict); }
};

} // namespace Catch

/// Path of one of the reference programs built alongside the tests
inline std::filesystem::path fixture(std::string_view name) {
    return std::filesystem::path{JUDGEBOX_FIXTURE_DIR} / name;
}

/// A scratch directory under the system temp dir, removed with everything in it on destruction
class TempDir
{
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "judgebox-test-XXXXXX").string();

        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::system_error(errno, std::generic_category(), "mkdtemp");
        }

        path_ = pattern;
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    ~TempDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    const std::filesystem::path& path() const { return path_; }

    /// Number of entries directly inside the directory
    std::size_t entry_count() const {
        auto it = std::filesystem::directory_iterator{path_};
        return static_cast<std::size_t>(std::distance(it, std::filesystem::directory_iterator{}));
    }

private:
    std::filesystem::path path_;
};

/// Upper bound on the wall-clock time a run may take before it is considered runaway:
/// the deadline, plus room for the kill, reap and a loaded CI machine
inline std::chrono::milliseconds runaway_bound(std::chrono::milliseconds deadline) {
    return deadline + std::chrono::milliseconds{1500};
}
