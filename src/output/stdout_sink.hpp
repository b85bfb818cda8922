#pragma once

#include "output/sink.hpp"

#include <string_view>

namespace judgebox {

/// Verdict output goes to stdout; logs and diagnostics stay on stderr
class StdoutSink : public Sink
{
public:
    void write(std::string_view str) override;
    void flush() override;

    ~StdoutSink() override = default;
};

} // namespace judgebox
