#pragma once

#include <judgebox/judge/verdict.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace judgebox {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity,
                        bool is_batch);

    void on_verdict(const JudgedSubmission& data) override;
    void on_summary(std::span<const JudgedSubmission> data, std::chrono::milliseconds elapsed) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// e.g. 1536 => "1.5 KiB"
    static std::string human_size(std::uint64_t bytes);

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    static fmt::text_style verdict_style(VerdictKind kind);

    std::string style_str(std::string_view str, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("submission", 0) => "submissions"
    ///  pluralize("verdict", 1) => "verdict"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - rejected verdicts, fatal errors, etc.
    //   success  - accepted verdicts
    //   value    - resource figures and other literal values
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto LIMIT_STYLE = fmt::fg(fmt::color::orange) | fmt::emphasis::bold;
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    bool is_batch_;
    std::size_t terminal_width_;
};

} // namespace judgebox
