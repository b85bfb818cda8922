#include "output/stdout_sink.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <string_view>

namespace judgebox {

void StdoutSink::write(std::string_view str) {
    fmt::print(stdout, "{}", str);
}

void StdoutSink::flush() {
    // NOLINTNEXTLINE(cert-err33-c)
    std::fflush(stdout);
}

} // namespace judgebox
