#include "output/plaintext_serializer.hpp"

#include <judgebox/judge/verdict.hpp>
#include <judgebox/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace judgebox {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity, bool is_batch)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , is_batch_{is_batch}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_verdict(const JudgedSubmission& data) {
    if (!should_output_verdict(verbosity_)) {
        return;
    }

    const Verdict& verdict = data.verdict;

    std::string out = fmt::format("{}: {}", data.name, style_str(short_name(verdict.kind), verdict_style(verdict.kind)));

    if (verdict.kind == VerdictKind::PartiallyCorrect && verdict.score) {
        out += fmt::format(" ({:.0f}%)", *verdict.score * 100);
    }

    if (should_output_verdict_message(verbosity_)) {
        out += fmt::format(" {}", verdict.kind);

        if (verdict.message) {
            out += fmt::format(" - {}", *verdict.message);
        }
    }

    out += '\n';

    if (should_output_usage(verbosity_)) {
        const ResourceUsage& usage = verdict.usage;

        out += fmt::format("  wall {} | cpu {} | memory {}", style_str(fmt::format("{}ms", usage.wall_time.count()), VALUE_STYLE),
                           style_str(fmt::format("{}ms", usage.cpu_time.count()), VALUE_STYLE),
                           style_str(human_size(usage.peak_memory), VALUE_STYLE));

        if (usage.exit_status) {
            out += fmt::format(" | {}", *usage.exit_status);
        }

        out += '\n';
    }

    sink_.write(out);
}

void PlainTextSerializer::on_summary(std::span<const JudgedSubmission> data, std::chrono::milliseconds elapsed) {
    if (!should_output_summary(verbosity_, is_batch_)) {
        return;
    }

    const auto num_correct = static_cast<std::size_t>(
        ranges::count_if(data, [](const JudgedSubmission& sub) { return sub.verdict.is_correct(); }));

    std::string out = LINE_DIVIDER_EM(terminal_width_) + "\n";

    if (num_correct == data.size()) {
        out += fmt::format("{} ({} in {:.2f}s)\n", style_str("All submissions correct", SUCCESS_STYLE),
                           fmt::format("{} {}", data.size(), pluralize("submission", data.size())),
                           static_cast<double>(elapsed.count()) / 1000.0);
        sink_.write(out);
        return;
    }

    out += fmt::format("{} of {} {} correct ({:.2f}s)\n", num_correct, data.size(),
                       pluralize("submission", data.size()), static_cast<double>(elapsed.count()) / 1000.0);

    boost::mp11::mp_for_each<boost::describe::describe_enumerators<VerdictKind>>([&](auto descriptor) {
        const auto count = static_cast<std::size_t>(ranges::count_if(
            data, [&](const JudgedSubmission& sub) { return sub.verdict.kind == descriptor.value; }));

        if (count == 0 || descriptor.value == VerdictKind::Correct) {
            return;
        }

        out += fmt::format("  {:<4} {:<20} {}\n", style_str(short_name(descriptor.value), verdict_style(descriptor.value)),
                           descriptor.name, count);
    });

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    sink_.write(fmt::format("{}: {}\n", style_str("Warning", WARNING_STYLE), what));
}

void PlainTextSerializer::on_error(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    sink_.write(fmt::format("{}: {}\n", style_str("Error", ERROR_STYLE), what));
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::human_size(std::uint64_t bytes) {
    static constexpr std::array<std::string_view, 4> UNITS = {"B", "KiB", "MiB", "GiB"};
    static constexpr double STEP = 1024.0;

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    while (value >= STEP && unit + 1 < UNITS.size()) {
        value /= STEP;
        ++unit;
    }

    return fmt::format("{:.1f} {}", value, UNITS.at(unit));
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return static_cast<std::size_t>(size.ws_col); });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error(), DEFAULT_WIDTH);
    }

    return width.value_or(DEFAULT_WIDTH);
}

fmt::text_style PlainTextSerializer::verdict_style(VerdictKind kind) {
    switch (kind) {
    case VerdictKind::Correct:
        return SUCCESS_STYLE;
    case VerdictKind::PartiallyCorrect:
        return WARNING_STYLE;
    case VerdictKind::TimeLimitExceeded:
    case VerdictKind::MemoryLimitExceeded:
    case VerdictKind::OutputLimitExceeded:
        return LIMIT_STYLE;
    case VerdictKind::WrongAnswer:
    case VerdictKind::RuntimeError:
    case VerdictKind::InternalError:
        return ERROR_STYLE;
    }
    return {};
}

std::string PlainTextSerializer::style_str(std::string_view str, fmt::text_style style) const {
    if (!do_colorize_) {
        return std::string{str};
    }

    return fmt::format(style, "{}", str);
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

} // namespace judgebox
