#include "catch2_custom.hpp"

#include "app/judge_app.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using judgebox::JudgeApp;
using judgebox::ProgramOptions;

namespace {

ProgramOptions silent_options() {
    ProgramOptions opts;
    opts.verbosity = judgebox::VerbosityLevel::Silent;
    opts.colorize_option = ProgramOptions::ColorizeOpt::Never;
    return opts;
}

fs::path write_file(const TempDir& dir, const std::string& name, const std::string& contents) {
    fs::path path = dir.path() / name;
    std::ofstream{path} << contents;
    return path;
}

} // namespace

TEST_CASE("Exit code of a single judgment") {
    TempDir dir;

    ProgramOptions opts = silent_options();
    opts.input_file = write_file(dir, "in.txt", "11\n");
    opts.expected_file = write_file(dir, "out.txt", "correct 11\n");

    SECTION("accepted") {
        opts.executable = fixture("correct_stdio");
        REQUIRE(JudgeApp{opts}.run() == 0);
    }

    SECTION("rejected") {
        opts.executable = fixture("incorrect_stdio");
        REQUIRE(JudgeApp{opts}.run() == 1);
    }
}

TEST_CASE("Exit code of a batch counts the failures") {
    TempDir dir;

    write_file(dir, "4.in", "4\n");
    write_file(dir, "4.out", "correct 4\n");
    write_file(dir, "5.in", "5\n");
    write_file(dir, "5.out", "correct 5\n");

    const std::string half = fixture("half_correct_stdio").string();
    const std::string incorrect = fixture("incorrect_stdio").string();

    ProgramOptions opts = silent_options();
    opts.jobs = 2;
    opts.batch_file = write_file(dir, "manifest.txt",
                                 "# name input expected\n" + half + " 4.in 4.out\n" + half + " 5.in 5.out\n" +
                                     incorrect + " 4.in 4.out\n");

    REQUIRE(JudgeApp{opts}.run() == 2);
}

TEST_CASE("Unreadable inputs fail the whole run") {
    TempDir dir;

    ProgramOptions opts = silent_options();
    opts.batch_file = write_file(dir, "manifest.txt", "prog missing.in missing.out\n");

    REQUIRE(JudgeApp{opts}.run() == EXIT_FAILURE);
}
