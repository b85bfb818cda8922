#pragma once

#include <judgebox/common/expected.hpp>
#include <judgebox/sandbox/submission.hpp>

#include "app/app.hpp" // IWYU pragma: export

#include <string>
#include <vector>

namespace judgebox {

/// Judges the submission (or batch manifest) named on the command line and prints the verdicts.
/// The exit code is the number of verdicts that are not Correct, capped at 125.
class JudgeApp final : public App
{
public:
    using App::App;

    static constexpr int MAX_EXIT_CODE = 125;

private:
    int run_impl() override;

    struct Job
    {
        std::string name;
        Submission submission;
        std::string expected;
    };

    Expected<std::vector<Job>, std::string> load_jobs() const;
};

} // namespace judgebox
