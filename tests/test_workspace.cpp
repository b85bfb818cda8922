#include "catch2_custom.hpp"

#include <judgebox/common/error_types.hpp>
#include <judgebox/sandbox/workspace.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace fs = std::filesystem;
using judgebox::ErrorKind;
using judgebox::Workspace;

TEST_CASE("Workspace is a fresh directory that is removed afterwards") {
    TempDir root;
    fs::path path;

    {
        auto workspace = Workspace::create(root.path());
        REQUIRE(workspace);

        path = workspace->path();
        REQUIRE(fs::is_directory(path));
        REQUIRE(path.parent_path() == root.path());
        REQUIRE(fs::is_empty(path));

        REQUIRE(workspace->write_file("input.txt", "correct 42\n"));
        REQUIRE(fs::exists(workspace->file("input.txt")));
    }

    REQUIRE_FALSE(fs::exists(path));
    REQUIRE(root.entry_count() == 0);
}

TEST_CASE("Each workspace is distinct") {
    TempDir root;

    auto first = Workspace::create(root.path());
    auto second = Workspace::create(root.path());
    REQUIRE(first);
    REQUIRE(second);

    REQUIRE(first->path() != second->path());
    REQUIRE(root.entry_count() == 2);
}

TEST_CASE("Kept workspaces stay on disk") {
    TempDir root;
    fs::path path;

    {
        auto workspace = Workspace::create(root.path(), /*keep=*/true);
        REQUIRE(workspace);
        path = workspace->path();
    }

    REQUIRE(fs::is_directory(path));
}

TEST_CASE("Moved-from workspace does not remove the directory") {
    TempDir root;

    auto workspace = Workspace::create(root.path());
    REQUIRE(workspace);

    fs::path path = workspace->path();

    {
        Workspace moved = std::move(workspace).value();
        REQUIRE(moved.path() == path);
    }

    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("Workspace under a missing root is an artifact failure") {
    TempDir root;

    auto workspace = Workspace::create(root.path() / "does" / "not" / "exist");

    REQUIRE_FALSE(workspace);
    REQUIRE(workspace.error() == ErrorKind::ArtifactFailure);
}

TEST_CASE("Reading files back from a workspace") {
    TempDir root;
    auto workspace = Workspace::create(root.path());
    REQUIRE(workspace);

    SECTION("missing file") {
        auto contents = workspace->read_file("output.txt", 1024);
        REQUIRE(contents);
        REQUIRE_FALSE(contents->has_value());
    }

    SECTION("whole file") {
        REQUIRE(workspace->write_file("output.txt", "correct 7\n"));

        auto contents = workspace->read_file("output.txt", 1024);
        REQUIRE(contents);
        REQUIRE(contents->has_value());
        REQUIRE((*contents)->data == "correct 7\n");
        REQUIRE_FALSE((*contents)->truncated);
    }

    SECTION("file past the limit is cut off") {
        REQUIRE(workspace->write_file("output.txt", std::string(100, 'x')));

        auto contents = workspace->read_file("output.txt", 10);
        REQUIRE(contents);
        REQUIRE((*contents)->data == std::string(10, 'x'));
        REQUIRE((*contents)->truncated);
    }

    SECTION("empty file") {
        REQUIRE(workspace->write_file("output.txt", ""));

        auto contents = workspace->read_file("output.txt", 10);
        REQUIRE(contents);
        REQUIRE(contents->has_value());
        REQUIRE((*contents)->data.empty());
    }

    SECTION("a symlink is not followed") {
        REQUIRE(workspace->write_file("secret", "hidden"));
        fs::create_symlink(workspace->file("secret"), workspace->file("output.txt"));

        auto contents = workspace->read_file("output.txt", 1024);
        REQUIRE_FALSE(contents);
        REQUIRE(contents.error() == ErrorKind::ArtifactFailure);
    }

    SECTION("a directory is not an output file") {
        fs::create_directory(workspace->file("output.txt"));

        auto contents = workspace->read_file("output.txt", 1024);
        REQUIRE_FALSE(contents);
        REQUIRE(contents.error() == ErrorKind::ArtifactFailure);
    }
}
