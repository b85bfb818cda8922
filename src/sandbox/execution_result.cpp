#include <judgebox/sandbox/execution_result.hpp>

#include <libassert/assert.hpp>

#include <sys/wait.h>

namespace judgebox {

ExitStatus ExitStatus::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return make_exited(WEXITSTATUS(status));
    }

    ASSERT(WIFSIGNALED(status), "wait status does not describe a terminated process", status);

    return make_signaled(WTERMSIG(status));
}

} // namespace judgebox
