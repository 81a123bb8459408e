#include "enginebox/file_contents.hh"
#include "enginebox/syscalls.hh"
#include "worker_child.hh"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <string_view>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

namespace {

struct Child {
    const enginebox::worker::child::Args& args;
    int error_fd;

    template <class... Args>
    [[noreturn]] void die(const Args&... msgs) const noexcept {
        static_assert(sizeof...(Args) > 0, "error message cannot be empty");
        for (auto msg : {std::string_view{msgs}...}) {
            if (not msg.empty()) {
                (void)write_all(error_fd, msg);
            }
        }
        _exit(42);
    }

    template <class... Args>
    void die_if_err(bool failed, const Args&... msgs) const noexcept {
        static_assert(
            sizeof...(Args) > 0, "Description of the cause of an error is necessary");
        if (failed) {
            int errnum = errno;
            const char* name = strerrorname_np(errnum);
            const char* descr = strerrordesc_np(errnum);
            die(msgs..., " - ", name ? name : "Unknown error", ": ",
                descr ? descr : "unknown description");
        }
    }

    void initialize(pid_t parent_pid) const noexcept {
        // Kill us if our parent dies
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        // Ensure our parent did not die before we set PR_SET_PDEATHSIG
        if (getppid() != parent_pid) {
            die("creator of the worker process died");
        }
        // Own process group, so that the whole worker tree can be killed at once
        die_if_err(setpgid(0, 0), "setpgid()");
    }

    void setup_fds() const noexcept {
        int fds[] = {args.stdin_fd, args.stdout_fd, args.stderr_fd, args.message_fd};
        static_assert(std::size(fds) == enginebox::worker::child::message_fd + 1);
        // Move the descriptors above the target range first, so that dup2() does not
        // overwrite a descriptor that has yet to be installed
        constexpr int min_temporary_fd = 10;
        for (int& fd : fds) {
            fd = fcntl(fd, F_DUPFD_CLOEXEC, std::max(min_temporary_fd, error_fd + 1));
            die_if_err(fd == -1, "fcntl(F_DUPFD_CLOEXEC)");
        }
        for (int target = 0; target < static_cast<int>(std::size(fds)); ++target) {
            die_if_err(dup2(fds[target], target) == -1, "dup2()"); // clears FD_CLOEXEC
        }
        // Do not leak descriptors inherited by the creator without O_CLOEXEC
        if (syscalls::close_range(
                enginebox::worker::child::message_fd + 1, ~0U, CLOSE_RANGE_CLOEXEC))
        {
            // Kernels older than 5.11 do not support the flag
            die_if_err(errno != EINVAL and errno != ENOSYS, "close_range()");
        }
    }

    void change_directory() const noexcept {
        die_if_err(chdir(args.working_dir), "chdir(", args.working_dir, ")");
    }

    void lower_rlimit(int resource, uint64_t bytes, const char* name) const noexcept {
        if (bytes == 0) {
            return; // no limit
        }
        rlimit rl{};
        die_if_err(getrlimit(resource, &rl), "getrlimit(", name, ")");
        // Unprivileged process cannot raise the hard limit
        auto limit = static_cast<rlim_t>(bytes);
        if (rl.rlim_max != RLIM_INFINITY) {
            limit = std::min(limit, rl.rlim_max);
        }
        rl.rlim_cur = limit;
        rl.rlim_max = limit;
        die_if_err(setrlimit(resource, &rl), "setrlimit(", name, ")");
    }

    void set_limits() const noexcept {
        lower_rlimit(RLIMIT_DATA, args.limits.heap_size_in_bytes(), "RLIMIT_DATA");
        lower_rlimit(RLIMIT_STACK, args.limits.stack_size_in_bytes(), "RLIMIT_STACK");
        // No core dumps of untrusted code in the sandbox directory
        rlimit no_core{0, 0};
        die_if_err(setrlimit(RLIMIT_CORE, &no_core), "setrlimit(RLIMIT_CORE)");
    }

    void drop_capabilities() const noexcept {
        die_if_err(cap_set_proc(args.capabilities), "cap_set_proc()");
        die_if_err(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0), "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    void reset_signals() const noexcept {
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // The creator may ignore SIGPIPE, the worker should not inherit that
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        die_if_err(sigemptyset(&sa.sa_mask), "sigemptyset()");
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
    }

    [[noreturn]] void exec() const noexcept {
        execve(args.executable, args.argv, args.envp);
        die_if_err(true, "execve(", args.executable, ")");
        __builtin_unreachable();
    }
};

} // namespace

namespace enginebox::worker::child {

void execute(const Args& args, int error_fd, pid_t parent_pid) noexcept {
    Child child{.args = args, .error_fd = error_fd};
    child.initialize(parent_pid);
    child.setup_fds();
    child.change_directory();
    child.set_limits();
    child.drop_capabilities();
    child.reset_signals();
    child.exec();
}

} // namespace enginebox::worker::child
