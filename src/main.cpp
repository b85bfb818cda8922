#include <judgebox/logging.hpp>

#include "app/judge_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    judgebox::init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    judgebox::JudgeApp app{judgebox::parse_args_or_exit(args)};

    return app.run();
}
