#pragma once

#include <judgebox/common/class_traits.hpp>
#include <judgebox/judge/verdict.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <chrono>
#include <span>
#include <string>
#include <string_view>

namespace judgebox {

/// One judged submission as presented to the user
struct JudgedSubmission
{
    /// Executable path, or the manifest line in batch mode
    std::string name;
    Verdict verdict;
};

class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_verdict(const JudgedSubmission& data) = 0;
    virtual void on_summary(std::span<const JudgedSubmission> data, std::chrono::milliseconds elapsed) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace judgebox
