#pragma once

#include "enginebox/resource_limits.hh"

#include <sys/capability.h>
#include <sys/types.h>

namespace enginebox::worker::child {

// Descriptor on which the worker writes its messages
constexpr int message_fd = 3;

// Everything has to be prepared before clone3(), the child does not allocate memory
struct Args {
    const char* executable;
    char* const* argv;
    char* const* envp;
    const char* working_dir;
    ResourceLimits limits;
    // Empty capability sets installed in the worker (cap_init() allocates, so the creator
    // prepares them)
    cap_t capabilities;
    // Installed as descriptors 0, 1, 2 and message_fd of the worker
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int message_fd;
};

// Sets up the process and executes the worker. Errors are written to @p error_fd.
[[noreturn]] void execute(const Args& args, int error_fd, pid_t parent_pid) noexcept;

} // namespace enginebox::worker::child
