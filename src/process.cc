#include "minuniq/concat_tostr.hh"
#include "minuniq/errmsg.hh"
#include "minuniq/file_descriptor.hh"
#include "minuniq/logger.hh"
#include "minuniq/macros/throw.hh"
#include "minuniq/pipe.hh"
#include "minuniq/process.hh"
#include "minuniq/syscalls.hh"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <linux/sched.h>
#include <optional>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace {

std::string_view env_key(std::string_view entry) noexcept {
    return entry.substr(0, entry.find('='));
}

// Inherited environment with @p extra_env entries overriding the ones with the same key
std::vector<std::string> prepare_env(const std::vector<std::string>& extra_env) {
    std::vector<std::string> env;
    for (char** entry = environ; *entry; ++entry) {
        auto key = env_key(*entry);
        bool overridden = std::any_of(extra_env.begin(), extra_env.end(), [&](auto const& e) {
            return env_key(e) == key;
        });
        if (not overridden) {
            env.emplace_back(*entry);
        }
    }
    env.insert(env.end(), extra_env.begin(), extra_env.end());
    return env;
}

std::vector<char*> to_null_terminated(std::vector<std::string>& strs) {
    std::vector<char*> res;
    res.reserve(strs.size() + 1);
    for (auto& str : strs) {
        res.emplace_back(str.data());
    }
    res.emplace_back(nullptr);
    return res;
}

// Only async-signal-safe functions may be used from here on

[[noreturn]] void die_in_child(int error_fd) noexcept {
    int errnum = errno;
    // If it fails, the parent sees a successful exec followed by exit status 127
    (void)write(error_fd, &errnum, sizeof(errnum));
    _exit(127);
}

[[noreturn]] void exec_child(
    const std::optional<Pipe>& stdin_pipe,
    const std::optional<Pipe>& stdout_pipe,
    int error_fd,
    char* const* argv,
    char* const* envp
) noexcept {
    // dup2() clears O_CLOEXEC on the new descriptor, the originals get closed by exec
    if (stdin_pipe and dup2(stdin_pipe->readable, STDIN_FILENO) == -1) {
        die_in_child(error_fd);
    }
    if (stdout_pipe and dup2(stdout_pipe->writable, STDOUT_FILENO) == -1) {
        die_in_child(error_fd);
    }
    execvpe(argv[0], argv, envp);
    die_in_child(error_fd);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1) {
        THROW("fcntl(F_GETFL)", errmsg());
    }
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK)) {
        THROW("fcntl(F_SETFL)", errmsg());
    }
}

} // namespace

namespace minuniq {

std::string ExitStatus::description() const {
    if (code == CLD_EXITED) {
        return concat_tostr("exited with ", status);
    }
    // waitid(WEXITED) reports only exits and deaths by a signal
    const char* name = sigabbrev_np(status);
    return concat_tostr(
        "killed by signal ",
        name ? name : std::to_string(status).c_str(),
        code == CLD_DUMPED ? " (core dumped)" : ""
    );
}

int ExitStatus::exit_code() const noexcept {
    if (code == CLD_EXITED) {
        return status;
    }
    return 128 + status;
}

Process::Process(Process&& other) noexcept
: state_{std::exchange(other.state_, State::WAITED)}
, pid_{std::exchange(other.pid_, 0)}
, pidfd_{std::move(other.pidfd_)}
, exit_status_{other.exit_status_} {}

Process& Process::operator=(Process&& other) noexcept {
    if (this != &other) {
        kill_and_wait();
        state_ = std::exchange(other.state_, State::WAITED);
        pid_ = std::exchange(other.pid_, 0);
        pidfd_ = std::move(other.pidfd_);
        exit_status_ = other.exit_status_;
    }
    return *this;
}

Process::~Process() { kill_and_wait(); }

void Process::kill() noexcept {
    if (state_ != State::RUNNING) {
        return;
    }
    // ESRCH may appear if the process has already died
    if (syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0) and errno != ESRCH) {
        errlog("pidfd_send_signal(", pid_, ", KILL)", errmsg());
    }
    state_ = State::UNWAITED;
}

ExitStatus Process::wait() {
    if (state_ == State::WAITED) {
        return exit_status_;
    }
    siginfo_t si{};
    while (syscalls::waitid(P_PIDFD, pidfd_, &si, WEXITED, nullptr)) {
        if (errno != EINTR) {
            THROW("waitid(", pid_, ")", errmsg());
        }
    }
    state_ = State::WAITED;
    exit_status_ = {
        .code = si.si_code,
        .status = si.si_status,
    };
    if (pidfd_.close()) {
        THROW("close()", errmsg());
    }
    return exit_status_;
}

void Process::kill_and_wait() noexcept {
    if (state_ == State::WAITED) {
        return;
    }
    kill();
    siginfo_t si{};
    int rc = 0;
    do {
        rc = syscalls::waitid(P_PIDFD, pidfd_, &si, WEXITED, nullptr);
    } while (rc == -1 and errno == EINTR);
    if (rc) {
        errlog("waitid(", pid_, ")", errmsg());
    }
    state_ = State::WAITED;
    exit_status_ = {
        .code = si.si_code,
        .status = si.si_status,
    };
    (void)pidfd_.close();
}

Spawned spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        THROW("spawn(): argv cannot be empty");
    }
    // Everything the child needs is prepared before clone3()
    auto argv_holder = options.argv;
    auto argv = to_null_terminated(argv_holder);
    auto env_holder = prepare_env(options.extra_env);
    auto envp = to_null_terminated(env_holder);

    std::optional<Pipe> stdin_pipe;
    if (options.pipe_stdin) {
        stdin_pipe = pipe2(O_CLOEXEC);
        if (not stdin_pipe) {
            THROW("pipe2()", errmsg());
        }
    }
    std::optional<Pipe> stdout_pipe;
    if (options.pipe_stdout) {
        stdout_pipe = pipe2(O_CLOEXEC);
        if (not stdout_pipe) {
            THROW("pipe2()", errmsg());
        }
    }
    // Exec failure is reported through this pipe, successful exec closes it
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    int child_pidfd{};
    clone_args cl_args = {
        .flags = CLONE_PIDFD,
        .pidfd = reinterpret_cast<uintptr_t>(&child_pidfd),
        .exit_signal = SIGCHLD,
    };
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        exec_child(stdin_pipe, stdout_pipe, error_pipe->writable, argv.data(), envp.data());
        __builtin_unreachable();
    }
    // Parent process
    Spawned res{
        .process = Process{pid, FileDescriptor{child_pidfd}},
        .stdin_fd = {},
        .stdout_fd = {},
    };
    if (error_pipe->writable.close()) {
        THROW("close()", errmsg());
    }
    if (stdin_pipe and stdin_pipe->readable.close()) {
        THROW("close()", errmsg());
    }
    if (stdout_pipe and stdout_pipe->writable.close()) {
        THROW("close()", errmsg());
    }

    int child_errnum = 0;
    ssize_t rc = 0;
    do {
        rc = read(error_pipe->readable, &child_errnum, sizeof(child_errnum));
    } while (rc == -1 and errno == EINTR);
    if (rc == -1) {
        THROW("read()", errmsg());
    }
    if (rc > 0) {
        // res.process gets reaped on unwinding
        THROW("failed to execute ", options.argv[0], errmsg(child_errnum));
    }

    if (stdin_pipe) {
        set_nonblocking(stdin_pipe->writable);
        res.stdin_fd = std::move(stdin_pipe->writable);
    }
    if (stdout_pipe) {
        set_nonblocking(stdout_pipe->readable);
        res.stdout_fd = std::move(stdout_pipe->readable);
    }
    return res;
}

} // namespace minuniq
