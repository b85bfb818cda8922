#pragma once

#include <judgebox/common/extra_formatters.hpp>

#include <boost/describe/enum.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace judgebox {

/// A checker's judgment of one answer
struct CheckerDecision
{
    /// 1 is fully accepted, 0 is rejected; anything in between is partial credit
    double score = 0.0;

    std::optional<std::string> message;

    static CheckerDecision make_accepted() { return {.score = 1.0, .message = std::nullopt}; }

    static CheckerDecision make_rejected(std::string message) { return {.score = 0.0, .message = std::move(message)}; }

    bool operator==(const CheckerDecision&) const = default;
};

/// Accepts ``<label> <integer>`` where the integer equals the expected one.
///
/// The expected answer may be either ``<label> <integer>`` or a bare integer. Whitespace around
/// and between the two tokens is ignored. Anything that does not parse is rejected, never thrown;
/// only a malformed *expected* answer throws ``std::invalid_argument``.
struct ExactChecker
{
    static constexpr std::string_view DEFAULT_LABEL = "correct";

    std::string label{DEFAULT_LABEL};

    CheckerDecision check(std::string_view output, std::string_view expected) const;
};

/// ``<label>`` followed by one or more reals, each within ``tolerance * max(1, |a|, |b|)``
/// of the expected value at the same position
struct ToleranceChecker
{
    static constexpr double DEFAULT_TOLERANCE = 1e-6;

    std::string label{ExactChecker::DEFAULT_LABEL};
    double tolerance = DEFAULT_TOLERANCE;

    CheckerDecision check(std::string_view output, std::string_view expected) const;
};

/// Like ExactChecker, but a well-formed answer with the wrong value earns ``partial_score``
struct PartialCreditChecker
{
    static constexpr double DEFAULT_PARTIAL_SCORE = 0.5;

    std::string label{ExactChecker::DEFAULT_LABEL};
    double partial_score = DEFAULT_PARTIAL_SCORE;

    CheckerDecision check(std::string_view output, std::string_view expected) const;
};

/// Line by line comparison ignoring the amount and kind of whitespace, and trailing blank lines
struct WhiteDiffChecker
{
    CheckerDecision check(std::string_view output, std::string_view expected) const;
};

using Checker = std::variant<ExactChecker, ToleranceChecker, PartialCreditChecker, WhiteDiffChecker>;

enum class CheckerKind { Exact, Tolerance, Partial, WhiteDiff };

BOOST_DESCRIBE_ENUM(CheckerKind, Exact, Tolerance, Partial, WhiteDiff);

/// Parameters for whichever checker kind is selected; unused fields are ignored
struct CheckerOptions
{
    std::string label{ExactChecker::DEFAULT_LABEL};
    double tolerance = ToleranceChecker::DEFAULT_TOLERANCE;
    double partial_score = PartialCreditChecker::DEFAULT_PARTIAL_SCORE;
};

Checker make_checker(CheckerKind kind, const CheckerOptions& options = {});

CheckerDecision check(const Checker& checker, std::string_view output, std::string_view expected);

/// The form the classifier consumes, so that tests and embedders can plug in arbitrary logic
using CheckFn = std::function<CheckerDecision(std::string_view output, std::string_view expected)>;

CheckFn to_check_fn(Checker checker);

} // namespace judgebox
