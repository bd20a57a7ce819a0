#pragma once

#include <csignal>
#include <linux/sched.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace syscalls {

inline pid_t clone3(clone_args* cl_args) noexcept {
    return static_cast<pid_t>(syscall(SYS_clone3, cl_args, sizeof(*cl_args)));
}

// Unlike the glibc wrapper, accepts P_PIDFD and struct rusage
inline int waitid(idtype_t idtype, id_t id, siginfo_t* infop, int options, rusage* ru) noexcept {
    return static_cast<int>(syscall(SYS_waitid, idtype, id, infop, options, ru));
}

inline int pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}

} // namespace syscalls
