#include <judgebox/judge/checker.hpp>

#include <judgebox/common/expected.hpp>

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace judgebox {

namespace {

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

std::vector<std::string_view> split_tokens(std::string_view text) {
    std::vector<std::string_view> tokens;

    while (true) {
        auto start = text.find_first_not_of(WHITESPACE);
        if (start == std::string_view::npos) {
            break;
        }
        text.remove_prefix(start);

        auto end = std::min(text.find_first_of(WHITESPACE), text.size());
        tokens.push_back(text.substr(0, end));
        text.remove_prefix(end);
    }

    return tokens;
}

template <typename T>
std::optional<T> parse_number(std::string_view token) {
    T value{};
    const char* end = token.data() + token.size();

    auto [ptr, ec] = std::from_chars(token.data(), end, value);

    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }

    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) {
            return std::nullopt;
        }
    }

    return value;
}

/// The tokens following ``label`` in a candidate's answer, or why there are none.
/// Label and values share the first non-blank line; only whitespace may follow that line.
Expected<std::vector<std::string_view>, std::string> labeled_values(std::string_view output, std::string_view label) {
    const auto start = std::min(output.find_first_not_of(WHITESPACE), output.size());
    output.remove_prefix(start);

    const auto eol = std::min(output.find('\n'), output.size());
    const std::string_view rest = output.substr(eol);

    auto tokens = split_tokens(output.substr(0, eol));

    if (tokens.empty()) {
        return std::string{"empty output"};
    }

    if (tokens.front() != label) {
        return fmt::format("expected label '{}', got '{}'", label, tokens.front());
    }

    tokens.erase(tokens.begin());

    if (tokens.empty()) {
        return fmt::format("no value after '{}' on the same line", label);
    }

    if (rest.find_first_not_of(WHITESPACE) != std::string_view::npos) {
        return fmt::format("unexpected output after the '{}' line", label);
    }

    return tokens;
}

/// The values of an expected answer, with an optional leading label
std::vector<std::string_view> expected_values(std::string_view expected, std::string_view label) {
    auto tokens = split_tokens(expected);

    if (!tokens.empty() && tokens.front() == label) {
        tokens.erase(tokens.begin());
    }

    if (tokens.empty()) {
        throw std::invalid_argument(fmt::format("expected answer '{}' has no value", expected));
    }

    return tokens;
}

std::int64_t expected_integer(std::string_view expected, std::string_view label) {
    auto tokens = expected_values(expected, label);
    auto value = tokens.size() == 1 ? parse_number<std::int64_t>(tokens.front()) : std::nullopt;

    if (!value) {
        throw std::invalid_argument(fmt::format("expected answer '{}' is not a single integer", expected));
    }

    return *value;
}

/// The integer of a ``<label> <integer>`` answer, or why it is malformed
Expected<std::int64_t, std::string> answer_integer(std::string_view output, std::string_view label) {
    auto values = labeled_values(output, label);

    if (!values) {
        return values.error();
    }

    if (values->size() != 1) {
        return fmt::format("trailing garbage after '{} {}'", label, values->front());
    }

    auto value = parse_number<std::int64_t>(values->front());

    if (!value) {
        return fmt::format("'{}' is not an integer", values->front());
    }

    return *value;
}

std::vector<std::vector<std::string>> normalized_lines(std::string_view text) {
    auto to_tokens = [](auto&& line) {
        auto str = line | ranges::to<std::string>();
        auto tokens = split_tokens(str);
        return std::vector<std::string>(tokens.begin(), tokens.end());
    };

    auto lines = text | ranges::views::split('\n') | ranges::views::transform(to_tokens) | ranges::to<std::vector>();

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    return lines;
}

} // namespace

CheckerDecision ExactChecker::check(std::string_view output, std::string_view expected) const {
    const std::int64_t want = expected_integer(expected, label);
    auto got = answer_integer(output, label);

    if (!got) {
        return CheckerDecision::make_rejected(got.error());
    }

    if (*got != want) {
        return CheckerDecision::make_rejected(fmt::format("expected {}, got {}", want, *got));
    }

    return CheckerDecision::make_accepted();
}

CheckerDecision ToleranceChecker::check(std::string_view output, std::string_view expected) const {
    std::vector<double> want;
    for (std::string_view token : expected_values(expected, label)) {
        auto value = parse_number<double>(token);
        if (!value) {
            throw std::invalid_argument(fmt::format("expected value '{}' is not a real number", token));
        }
        want.push_back(*value);
    }

    auto values = labeled_values(output, label);

    if (!values) {
        return CheckerDecision::make_rejected(values.error());
    }

    if (values->size() != want.size()) {
        return CheckerDecision::make_rejected(
            fmt::format("expected {} value(s), got {}", want.size(), values->size()));
    }

    for (std::size_t i = 0; i < want.size(); ++i) {
        auto got = parse_number<double>((*values)[i]);

        if (!got) {
            return CheckerDecision::make_rejected(fmt::format("'{}' is not a real number", (*values)[i]));
        }

        const double bound = tolerance * std::max({1.0, std::abs(*got), std::abs(want[i])});

        if (std::abs(*got - want[i]) > bound) {
            return CheckerDecision::make_rejected(
                fmt::format("value #{}: expected {}, got {} (tolerance {})", i + 1, want[i], *got, tolerance));
        }
    }

    return CheckerDecision::make_accepted();
}

CheckerDecision PartialCreditChecker::check(std::string_view output, std::string_view expected) const {
    const std::int64_t want = expected_integer(expected, label);
    auto got = answer_integer(output, label);

    if (!got) {
        return CheckerDecision::make_rejected(got.error());
    }

    if (*got != want) {
        return {.score = partial_score, .message = fmt::format("expected {}, got {}", want, *got)};
    }

    return CheckerDecision::make_accepted();
}

CheckerDecision WhiteDiffChecker::check(std::string_view output, std::string_view expected) const {
    const auto got = normalized_lines(output);
    const auto want = normalized_lines(expected);

    const std::size_t common = std::min(got.size(), want.size());

    for (std::size_t i = 0; i < common; ++i) {
        if (got[i] != want[i]) {
            return CheckerDecision::make_rejected(fmt::format("line {} differs", i + 1));
        }
    }

    if (got.size() != want.size()) {
        return CheckerDecision::make_rejected(fmt::format("expected {} line(s), got {}", want.size(), got.size()));
    }

    return CheckerDecision::make_accepted();
}

Checker make_checker(CheckerKind kind, const CheckerOptions& options) {
    switch (kind) {
    case CheckerKind::Exact:
        return ExactChecker{.label = options.label};
    case CheckerKind::Tolerance:
        return ToleranceChecker{.label = options.label, .tolerance = options.tolerance};
    case CheckerKind::Partial:
        return PartialCreditChecker{.label = options.label, .partial_score = options.partial_score};
    case CheckerKind::WhiteDiff:
        return WhiteDiffChecker{};
    }

    throw std::invalid_argument(fmt::format("unknown checker kind {}", fmt::underlying(kind)));
}

CheckerDecision check(const Checker& checker, std::string_view output, std::string_view expected) {
    return std::visit([&](const auto& impl) { return impl.check(output, expected); }, checker);
}

CheckFn to_check_fn(Checker checker) {
    return [checker = std::move(checker)](std::string_view output, std::string_view expected) {
        return check(checker, output, expected);
    };
}

} // namespace judgebox
