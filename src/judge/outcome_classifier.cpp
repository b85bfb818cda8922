#include <judgebox/judge/outcome_classifier.hpp>

#include <judgebox/judge/checker.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/logging.hpp>
#include <judgebox/sandbox/execution_result.hpp>

#include <fmt/format.h>

#include <cmath>
#include <csignal>
#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace judgebox {

namespace {

constexpr std::size_t STDERR_EXCERPT_LENGTH = 200;

/// First line of the program's stderr, shortened for display
std::optional<std::string> stderr_excerpt(std::string_view stderr_data) {
    auto line = stderr_data.substr(0, stderr_data.find('\n'));

    if (line.empty()) {
        return std::nullopt;
    }

    if (line.size() > STDERR_EXCERPT_LENGTH) {
        return fmt::format("{}...", line.substr(0, STDERR_EXCERPT_LENGTH));
    }

    return std::string{line};
}

bool is_memory_fault(const ExecutionResult& result) {
    return result.memory_limit_hit || result.kill_reason == KillReason::MemoryLimit ||
           result.peak_memory > result.limits.memory_limit;
}

bool is_time_fault(const ExecutionResult& result) {
    return result.kill_reason == KillReason::WallTimeout || result.status.is_signal(SIGXCPU) ||
           result.cpu_time > result.limits.time_limit || result.wall_time > result.limits.time_limit;
}

bool is_output_fault(const ExecutionResult& result) {
    return result.output_truncated || result.kill_reason == KillReason::OutputLimit ||
           result.status.is_signal(SIGXFSZ);
}

Verdict make_verdict(VerdictKind kind, const ExecutionResult& result, std::optional<std::string> message) {
    return {.kind = kind, .score = std::nullopt, .message = std::move(message), .usage = ResourceUsage::from(result)};
}

Verdict from_decision(const CheckerDecision& decision, const ExecutionResult& result) {
    if (std::isnan(decision.score) || decision.score < 0.0 || decision.score > 1.0) {
        return make_verdict(VerdictKind::InternalError, result,
                            fmt::format("checker returned score {} outside [0, 1]", decision.score));
    }

    VerdictKind kind = VerdictKind::PartiallyCorrect;

    if (decision.score == 1.0) {
        kind = VerdictKind::Correct;
    } else if (decision.score == 0.0) {
        kind = VerdictKind::WrongAnswer;
    }

    Verdict verdict = make_verdict(kind, result, decision.message);
    verdict.score = decision.score;

    return verdict;
}

} // namespace

Verdict classify(const ExecutionResult& result, std::string_view expected, const CheckFn& checker) {
    const auto& limits = result.limits;

    if (result.kill_reason == KillReason::Cancelled) {
        return make_verdict(VerdictKind::InternalError, result, "run was cancelled");
    }

    if (is_memory_fault(result)) {
        return make_verdict(VerdictKind::MemoryLimitExceeded, result,
                            fmt::format("memory limit of {} bytes exceeded (peak RSS {} bytes)", limits.memory_limit,
                                        result.peak_memory));
    }

    // Time before output: a program that is both slow and verbose is reported as slow
    if (is_time_fault(result)) {
        return make_verdict(VerdictKind::TimeLimitExceeded, result,
                            fmt::format("time limit of {}ms exceeded (cpu {}ms, wall {}ms)", limits.time_limit.count(),
                                        result.cpu_time.count(), result.wall_time.count()));
    }

    if (is_output_fault(result)) {
        return make_verdict(VerdictKind::OutputLimitExceeded, result,
                            fmt::format("output limit of {} bytes exceeded", limits.output_limit));
    }

    if (result.violation || result.kill_reason == KillReason::ForbiddenAccess) {
        return make_verdict(VerdictKind::RuntimeError, result,
                            fmt::format("forbidden access: {}", result.violation.value_or("unknown")));
    }

    if (!result.status.is_clean_exit()) {
        std::string message = fmt::format("{}", result.status);

        if (auto excerpt = stderr_excerpt(result.stderr_data)) {
            message += fmt::format(": {}", *excerpt);
        }

        return make_verdict(VerdictKind::RuntimeError, result, std::move(message));
    }

    try {
        return from_decision(checker(result.answer(), expected), result);
    } catch (const std::exception& ex) {
        LOG_ERROR("Checker failed: {}", ex);
        return make_verdict(VerdictKind::InternalError, result, fmt::format("checker failed: {}", ex.what()));
    } catch (...) {
        LOG_ERROR("Checker threw an exception not derived from std::exception");
        return make_verdict(VerdictKind::InternalError, result, "checker crashed with an unknown exception");
    }
}

Verdict classify(const ExecutionResult& result, std::string_view expected, const Checker& checker) {
    return classify(result, expected, to_check_fn(checker));
}

} // namespace judgebox
