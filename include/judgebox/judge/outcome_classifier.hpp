#pragma once

#include <judgebox/judge/checker.hpp>
#include <judgebox/judge/verdict.hpp>
#include <judgebox/sandbox/execution_result.hpp>

#include <string_view>

namespace judgebox {

/// Maps a finished run to exactly one verdict. First match wins:
///   - cancelled run                                                 -> InternalError
///   - syscall watch hit, killed for memory, or peak RSS over the limit -> MemoryLimitExceeded
///   - killed at the deadline, SIGXCPU, or cpu/wall time over the limit -> TimeLimitExceeded
///   - output truncated or SIGXFSZ                                   -> OutputLimitExceeded
///   - stopped from reaching outside its workspace                   -> RuntimeError
///   - any other signal or a non-zero exit code                      -> RuntimeError
///   - otherwise the checker's decision                              -> Correct / WrongAnswer / PartiallyCorrect
///
/// ``checker`` is only invoked in the last case. If it throws, or returns a score that is NaN
/// or outside [0, 1], the verdict is InternalError.
Verdict classify(const ExecutionResult& result, std::string_view expected, const CheckFn& checker);

Verdict classify(const ExecutionResult& result, std::string_view expected, const Checker& checker);

} // namespace judgebox
