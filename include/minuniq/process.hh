#pragma once

#include "minuniq/file_descriptor.hh"

#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace minuniq {

struct ExitStatus {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    // "exited with 3", "killed by signal KILL" or "killed by signal SEGV (core dumped)"
    [[nodiscard]] std::string description() const;

    // Exit code as reported by a shell: the exit status or 128 + signal number
    [[nodiscard]] int exit_code() const noexcept;

    friend bool operator==(const ExitStatus&, const ExitStatus&) = default;
};

// Owns a child process, the destructor kills and reaps it
class Process {
    // State automaton:
    //                         process exited on its own
    //                     ,-------------------------------.
    //                    /             wait()             v
    // --> RUNNING ------------> UNWAITED ------------> WAITED
    //                kill()                 wait()
    enum class State {
        RUNNING, // started but neither killed nor waited
        UNWAITED, // killed but not waited
        WAITED, // dead and waited (or no process at all)
    } state_ = State::WAITED;

    pid_t pid_ = 0;
    FileDescriptor pidfd_;
    ExitStatus exit_status_{};

public:
    Process() noexcept = default;

    Process(pid_t pid, FileDescriptor pidfd) noexcept
    : state_{State::RUNNING}
    , pid_{pid}
    , pidfd_{std::move(pidfd)} {}

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    Process(Process&& other) noexcept;
    Process& operator=(Process&& other) noexcept;

    ~Process();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] bool is_waited() const noexcept { return state_ == State::WAITED; }

    // Sends SIGKILL, does nothing if the process was already killed or waited
    void kill() noexcept;

    // Reaps the process, blocking until it dies. Returns the cached status if already waited.
    // Throws on error.
    ExitStatus wait();

private:
    void kill_and_wait() noexcept;
};

struct SpawnOptions {
    std::vector<std::string> argv; // argv[0] is looked up in PATH unless it contains a slash
    std::vector<std::string> extra_env; // "KEY=VALUE" entries overriding the inherited ones
    bool pipe_stdin = false; // otherwise stdin is inherited
    bool pipe_stdout = false; // otherwise stdout is inherited
    // stderr is always inherited
};

struct Spawned {
    Process process;
    FileDescriptor stdin_fd; // non-blocking write end, open iff SpawnOptions::pipe_stdin
    FileDescriptor stdout_fd; // non-blocking read end, open iff SpawnOptions::pipe_stdout
};

// Throws on error, including the failure of the child to execute argv[0]
Spawned spawn(const SpawnOptions& options);

} // namespace minuniq
