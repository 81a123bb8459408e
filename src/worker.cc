#include "enginebox/concat_tostr.hh"
#include "enginebox/debug.hh"
#include "enginebox/errmsg.hh"
#include "enginebox/file_contents.hh"
#include "enginebox/file_descriptor.hh"
#include "enginebox/logger.hh"
#include "enginebox/macros/throw.hh"
#include "enginebox/overloaded.hh"
#include "enginebox/pipe.hh"
#include "enginebox/syscalls.hh"
#include "enginebox/worker.hh"
#include "worker_child.hh"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <linux/sched.h>
#include <linux/wait.h>
#include <memory>
#include <optional>
#include <poll.h>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/timerfd.h>
#include <type_traits>
#include <unistd.h>
#include <variant>
#include <vector>

using std::chrono::steady_clock;
using std::chrono_literals::operator""ns;
using std::chrono_literals::operator""s;

namespace {

constexpr DebugLogger<debug_logs_enabled> debuglog{};

using enginebox::EngineResponse;
using enginebox::EngineResponseStatus;
using enginebox::ExecutionResult;

// Terminal events of a run
struct Completed {
    EngineResponse response;
};

struct TimedOut {};

struct Failed {
    std::string description;
};

using Outcome = std::variant<Completed, TimedOut, Failed>;

// Single-assignment slot: the first settled outcome wins, later ones are ignored
class FirstOutcome {
    std::optional<Outcome> outcome_;

public:
    bool settle(Outcome outcome) {
        if (outcome_) {
            return false;
        }
        outcome_.emplace(std::move(outcome));
        return true;
    }

    [[nodiscard]] bool settled() const noexcept { return outcome_.has_value(); }

    [[nodiscard]] Outcome take() && { return std::move(*outcome_); }
};

// Owns the worker process: a worker that was not waited for is killed on destruction
class WorkerProcess {
    pid_t pid_;
    FileDescriptor pidfd_;
    bool waited_ = false;
    siginfo_t si_{};

public:
    WorkerProcess(pid_t pid, FileDescriptor pidfd) noexcept
    : pid_{pid}
    , pidfd_{std::move(pidfd)} {}

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess(WorkerProcess&&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;
    WorkerProcess& operator=(WorkerProcess&&) = delete;

    ~WorkerProcess() {
        if (not waited_) {
            kill();
            (void)syscalls::waitid(P_PIDFD, pidfd_, &si_, WEXITED, nullptr);
        }
    }

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] int pidfd() const noexcept { return pidfd_; }

    // Kills the worker and its process group. Has to happen before wait(), as afterwards
    // the group id may be reused.
    void kill() noexcept {
        if (waited_) {
            return;
        }
        // ESRCH is expected here: the group may be empty or not created yet
        (void)::kill(-pid_, SIGKILL);
        (void)syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0);
    }

    void wait() {
        if (waited_) {
            return;
        }
        if (syscalls::waitid(P_PIDFD, pidfd_, &si_, WEXITED, nullptr)) {
            THROW("waitid()", errmsg());
        }
        waited_ = true;
    }

    [[nodiscard]] std::string si_description() const {
        auto signal_description = [](const char* prefix, int signum) {
            auto abbrv = sigabbrev_np(signum);
            auto descr = sigdescr_np(signum);
            if (abbrv) {
                if (descr) {
                    return concat_tostr(prefix, " SIG", abbrv, " - ", descr);
                }
                return concat_tostr(prefix, " SIG", abbrv);
            }
            return concat_tostr(prefix, " with number ", signum);
        };
        switch (si_.si_code) {
        case CLD_EXITED: return concat_tostr("exited with ", si_.si_status);
        case CLD_KILLED: return signal_description("killed by signal", si_.si_status);
        case CLD_DUMPED: return signal_description("killed and dumped by signal", si_.si_status);
        }
        return "unable to describe";
    }
};

struct RunState {
    std::string standard_output;
    std::string standard_error;
    FirstOutcome outcome;
};

std::string message_text(const nlohmann::json& message) {
    return message.is_string() ? message.get<std::string>() : message.dump();
}

// Handles one line of the message channel: {"type": ..., "message": ...}
void handle_message(std::string_view line, RunState& state) {
    if (state.outcome.settled()) {
        return; // nothing counts after the terminal event
    }
    if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
        return;
    }
    auto msg = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (msg.is_discarded() or not msg.is_object()) {
        state.outcome.settle(Failed{"malformed message from the worker"});
        return;
    }
    auto type_it = msg.find("type");
    if (type_it == msg.end() or not type_it->is_string()) {
        state.outcome.settle(Failed{"message from the worker has no type"});
        return;
    }
    const auto& type = type_it->get_ref<const std::string&>();
    auto message_it = msg.find("message");
    const auto message = message_it == msg.end() ? nlohmann::json{} : *message_it;

    if (type == "stdout") {
        state.standard_output += message_text(message);
    } else if (type == "stderr") {
        state.standard_error += message_text(message);
    } else if (type == "result") {
        auto response = enginebox::parse_engine_response(message);
        if (not response) {
            state.outcome.settle(Failed{
                concat_tostr("invalid result message from the worker: ", message.dump())});
            return;
        }
        state.outcome.settle(Completed{std::move(*response)});
    } else if (type == "error") {
        state.outcome.settle(Failed{concat_tostr("worker reported: ", message_text(message))});
    } else {
        debuglog("ignoring worker message of unknown type: ", type);
    }
}

// Appends what is available in the non-blocking @p fd to @p dest. Returns false on EOF.
bool read_available(int fd, std::string& dest) {
    // Bounded, so that a flood of output cannot starve the other events
    constexpr int max_reads = 16;
    std::array<char, 1 << 16> buff;
    for (int i = 0; i < max_reads;) {
        auto len = read(fd, buff.data(), buff.size());
        if (len > 0) {
            dest.append(buff.data(), static_cast<size_t>(len));
            ++i;
            continue;
        }
        if (len == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN) {
            return true;
        }
        THROW("read()", errmsg());
    }
    return true;
}

Pipe make_nonblocking_pipe() {
    auto pipe = pipe2(O_CLOEXEC);
    if (not pipe) {
        THROW("pipe2()", errmsg());
    }
    if (fcntl(pipe->readable, F_SETFL, O_NONBLOCK)) {
        THROW("fcntl()", errmsg());
    }
    return std::move(*pipe);
}

std::string parent_directory(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) {
        return ".";
    }
    if (pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

constexpr const char* default_path_env = "/usr/local/bin:/usr/bin:/bin";

const char* path_env() noexcept {
    const char* path = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    return path ? path : default_path_env;
}

// Resolves a program name the way a shell would, as execve() does not search PATH
std::string find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    std::string_view dirs = path_env();
    while (not dirs.empty()) {
        auto dir = dirs.substr(0, dirs.find(':'));
        dirs.remove_prefix(std::min(dirs.size(), dir.size() + 1));
        auto candidate = concat_tostr(dir.empty() ? "." : dir, '/', name);
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return name; // execve() will report ENOENT
}

std::vector<std::string> worker_environment(
    std::string_view operation_type, const enginebox::ResourceLimits& limits,
    const std::string& working_dir) {
    return {
        concat_tostr("PATH=", path_env()),
        concat_tostr("HOME=", working_dir),
        concat_tostr("ENGINEBOX_MESSAGE_FD=", enginebox::worker::child::message_fd),
        concat_tostr("ENGINEBOX_OPERATION_TYPE=", operation_type),
        concat_tostr("ENGINEBOX_MAX_OLD_GENERATION_SIZE_MB=", limits.max_old_generation_size_mb),
        concat_tostr(
            "ENGINEBOX_MAX_YOUNG_GENERATION_SIZE_MB=", limits.max_young_generation_size_mb),
        concat_tostr("ENGINEBOX_STACK_SIZE_MB=", limits.stack_size_mb),
    };
}

std::vector<char*> to_argv(std::vector<std::string>& strs) {
    std::vector<char*> res;
    res.reserve(strs.size() + 1);
    for (auto& str : strs) {
        res.emplace_back(str.data());
    }
    res.emplace_back(nullptr);
    return res;
}

struct CapFree {
    void operator()(cap_t caps) const noexcept { (void)cap_free(caps); }
};

using Capabilities = std::unique_ptr<std::remove_pointer_t<cap_t>, CapFree>;

// Capability sets with nothing in them; allocated here, as the child must not allocate
Capabilities no_capabilities() {
    Capabilities caps{cap_init()};
    if (not caps) {
        THROW("cap_init()", errmsg());
    }
    if (cap_clear(caps.get())) {
        THROW("cap_clear()", errmsg());
    }
    return caps;
}

void arm_timer(int timer_fd, std::chrono::nanoseconds timeout) {
    // Zero it_value would disarm the timer instead of firing immediately
    timeout = std::max(timeout, 1ns);
    itimerspec its{};
    its.it_value.tv_sec = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    its.it_value.tv_nsec = (timeout % 1s).count();
    if (timerfd_settime(timer_fd, 0, &its, nullptr)) {
        THROW("timerfd_settime()", errmsg());
    }
}

} // namespace

namespace enginebox::worker {

ExecutionResult execute(
    const std::string& entry_path, std::string_view operation_type,
    const nlohmann::json& operation, const Options& options) {
    // Everything the child needs is prepared here, the child must not allocate
    std::vector<std::string> args;
    if (options.interpreter) {
        args.emplace_back(find_executable(*options.interpreter));
    }
    args.emplace_back(entry_path);
    const auto working_dir = options.working_dir.value_or(parent_directory(entry_path));
    auto env = worker_environment(operation_type, options.limits, working_dir);
    auto argv = to_argv(args);
    auto envp = to_argv(env);

    FileDescriptor input_fd{memfd_create("enginebox worker input", MFD_CLOEXEC)};
    if (not input_fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    const auto input = nlohmann::json{
        {"operationType", std::string{operation_type}},
        {"operation", operation},
    }.dump();
    if (write_all(input_fd, input) != input.size()) {
        THROW("write()", errmsg());
    }
    if (lseek(input_fd, 0, SEEK_SET)) {
        THROW("lseek()", errmsg());
    }

    auto stdout_pipe = make_nonblocking_pipe();
    auto stderr_pipe = make_nonblocking_pipe();
    auto message_pipe = make_nonblocking_pipe();
    FileDescriptor error_fd{memfd_create("enginebox worker errors", MFD_CLOEXEC)};
    if (not error_fd.is_open()) {
        THROW("memfd_create()", errmsg());
    }
    FileDescriptor timer_fd{timerfd_create(CLOCK_MONOTONIC, TFD_CLOEXEC | TFD_NONBLOCK)};
    if (not timer_fd.is_open()) {
        THROW("timerfd_create()", errmsg());
    }

    auto capabilities = no_capabilities();

    const child::Args child_args = {
        .executable = args.front().c_str(),
        .argv = argv.data(),
        .envp = envp.data(),
        .working_dir = working_dir.c_str(),
        .limits = options.limits,
        .capabilities = capabilities.get(),
        .stdin_fd = input_fd,
        .stdout_fd = stdout_pipe.writable,
        .stderr_fd = stderr_pipe.writable,
        .message_fd = message_pipe.writable,
    };
    const auto parent_pid = getpid();
    int child_pidfd{};
    clone_args cl_args = {
        .flags = CLONE_PIDFD,
        .pidfd = reinterpret_cast<uintptr_t>(&child_pidfd),
        .exit_signal = SIGCHLD,
    };

    const auto start_time = steady_clock::now();
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        child::execute(child_args, error_fd, parent_pid);
        __builtin_unreachable();
    }
    // Parent process
    WorkerProcess worker{pid, FileDescriptor{child_pidfd}};
    debuglog("spawned worker [", pid, "]: ", entry_path, " (", operation_type, ')');

    // The write ends have to be closed here, so that EOF is seen once the worker is done
    if (input_fd.close() or stdout_pipe.writable.close() or stderr_pipe.writable.close() or
        message_pipe.writable.close())
    {
        THROW("close()", errmsg());
    }
    arm_timer(timer_fd, options.timeout);

    enum : size_t { MESSAGES, STDOUT, STDERR, EXIT, TIMER, FDS_NUM };
    std::array<pollfd, FDS_NUM> pfds;
    pfds[MESSAGES] = {.fd = message_pipe.readable, .events = POLLIN, .revents = 0};
    pfds[STDOUT] = {.fd = stdout_pipe.readable, .events = POLLIN, .revents = 0};
    pfds[STDERR] = {.fd = stderr_pipe.readable, .events = POLLIN, .revents = 0};
    pfds[EXIT] = {.fd = worker.pidfd(), .events = POLLIN, .revents = 0};
    pfds[TIMER] = {.fd = timer_fd, .events = POLLIN, .revents = 0};

    RunState state;
    std::string message_buff;
    auto drain = [&](size_t idx, std::string& dest) {
        if (pfds[idx].fd >= 0 and not read_available(pfds[idx].fd, dest)) {
            pfds[idx].fd = -1; // EOF, poll() ignores negative descriptors
        }
    };
    auto process_messages = [&](bool last_call) {
        size_t beg = 0;
        for (size_t nl; (nl = message_buff.find('\n', beg)) != std::string::npos; beg = nl + 1)
        {
            handle_message(std::string_view{message_buff}.substr(beg, nl - beg), state);
        }
        message_buff.erase(0, beg);
        // The last line does not need a trailing newline
        if (last_call and not message_buff.empty()) {
            handle_message(message_buff, state);
            message_buff.clear();
        }
    };

    while (not state.outcome.settled()) {
        for (auto& pfd : pfds) {
            pfd.revents = 0;
        }
        int rc = poll(pfds.data(), pfds.size(), -1);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        // Output and messages go first: what was sent before the exit or the timeout counts
        if (pfds[STDOUT].revents) {
            drain(STDOUT, state.standard_output);
        }
        if (pfds[STDERR].revents) {
            drain(STDERR, state.standard_error);
        }
        if (pfds[MESSAGES].revents) {
            drain(MESSAGES, message_buff);
            process_messages(pfds[MESSAGES].fd < 0);
        }
        if (state.outcome.settled()) {
            break;
        }

        if (pfds[EXIT].revents & POLLIN) {
            // Data written just before the exit may still wait in the pipes
            drain(STDOUT, state.standard_output);
            drain(STDERR, state.standard_error);
            drain(MESSAGES, message_buff);
            process_messages(true);
            worker.kill(); // descendants of the worker
            worker.wait();
            state.outcome.settle(Failed{concat_tostr(
                "worker exited without sending a result (", worker.si_description(), ')')});
            break;
        }
        if (pfds[TIMER].revents & POLLIN) {
            state.outcome.settle(TimedOut{});
        }
    }
    const auto end_time = steady_clock::now();
    (void)timer_fd.close(); // cancels the timer
    worker.kill();
    worker.wait();

    ExecutionResult res{
        .time_in_seconds = std::chrono::duration<double>(end_time - start_time).count(),
        .verdict = EngineResponseStatus::Error,
        .output = nlohmann::json::object(),
        .standard_output = {},
        .standard_error = {},
    };
    auto outcome = std::move(state.outcome).take();
    std::visit(
        overloaded{
            [&](Completed& completed) {
                res.verdict = completed.response.status;
                res.output = std::move(completed.response.response);
                res.standard_output = std::move(state.standard_output);
                res.standard_error = std::move(state.standard_error);
            },
            [&](TimedOut& /*unused*/) {
                res.verdict = EngineResponseStatus::Timeout;
                if (options.keep_output_on_timeout) {
                    res.standard_output = std::move(state.standard_output);
                    res.standard_error = std::move(state.standard_error);
                }
            },
            [&](Failed& failed) {
                // The child reports problems that happened before execve() here
                auto setup_error = get_file_contents(error_fd);
                if (not setup_error.empty()) {
                    failed.description += concat_tostr(": ", setup_error);
                }
                errlog("worker [", pid, "] ", entry_path, " failed: ", failed.description);
                res.verdict = EngineResponseStatus::Error;
                res.standard_output = std::move(state.standard_output);
                res.standard_error = std::move(state.standard_error);
            },
        },
        outcome);
    debuglog(
        "worker [", pid, "] finished: ", to_str(res.verdict), " in ", res.time_in_seconds,
        "s");
    return res;
}

} // namespace enginebox::worker
