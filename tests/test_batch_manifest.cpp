#include "catch2_custom.hpp"

#include "user/batch_manifest.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;
using judgebox::parse_batch_manifest;

TEST_CASE("Manifest lines become batch entries") {
    constexpr std::string_view MANIFEST = "# submissions for problem A\n"
                                          "\n"
                                          "bin/alice  tests/1.in  tests/1.out\n"
                                          "   # indented comment\n"
                                          "/opt/bob/run\t/data/1.in /data/1.out";

    auto entries = parse_batch_manifest(MANIFEST, "/srv/judge");

    REQUIRE(entries);
    REQUIRE(entries->size() == 2);

    const auto& alice = entries->at(0);
    REQUIRE(alice.name == "bin/alice tests/1.in tests/1.out");
    REQUIRE(alice.executable == fs::path{"/srv/judge/bin/alice"});
    REQUIRE(alice.input_file == fs::path{"/srv/judge/tests/1.in"});
    REQUIRE(alice.expected_file == fs::path{"/srv/judge/tests/1.out"});

    // Absolute paths are kept as they are
    const auto& bob = entries->at(1);
    REQUIRE(bob.executable == fs::path{"/opt/bob/run"});
    REQUIRE(bob.input_file == fs::path{"/data/1.in"});
    REQUIRE(bob.expected_file == fs::path{"/data/1.out"});
}

TEST_CASE("Malformed manifests are rejected") {
    SECTION("too few fields") {
        REQUIRE(parse_batch_manifest("# header\nbin/alice tests/1.in\n", "/") ==
                std::string{"manifest line 2: expected '<executable> <input> <expected>', got 2 field(s)"});
    }

    SECTION("too many fields") {
        REQUIRE(parse_batch_manifest("a b c\na b c d\n", "/") ==
                std::string{"manifest line 2: expected '<executable> <input> <expected>', got 4 field(s)"});
    }

    SECTION("nothing but comments") {
        REQUIRE(parse_batch_manifest("# nothing yet\n\n", "/") == std::string{"manifest lists no submissions"});
        REQUIRE(parse_batch_manifest("", "/") == std::string{"manifest lists no submissions"});
    }
}

TEST_CASE("Manifests are read relative to their own directory") {
    TempDir dir;
    const fs::path manifest = dir.path() / "manifest.txt";
    std::ofstream{manifest} << "prog in.txt out.txt\n";

    auto entries = judgebox::read_batch_manifest(manifest);

    REQUIRE(entries);
    REQUIRE(entries->size() == 1);
    REQUIRE(entries->front().executable == dir.path() / "prog");
    REQUIRE(entries->front().expected_file == dir.path() / "out.txt");
}

TEST_CASE("Reading text files") {
    TempDir dir;
    const fs::path file = dir.path() / "big.txt";
    const std::string contents(200 * 1024, 'z');
    std::ofstream{file} << contents;

    auto read = judgebox::read_text_file(file);
    REQUIRE(read);
    REQUIRE(read->size() == contents.size());
    REQUIRE(*read == contents);

    auto missing = judgebox::read_text_file(dir.path() / "missing.txt");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error() == std::errc::no_such_file_or_directory);

    auto unreadable = judgebox::read_batch_manifest(dir.path() / "missing.txt");
    REQUIRE_FALSE(unreadable);
    REQUIRE_THAT(unreadable.error(), Catch::Matchers::StartsWith("could not read"));
}
