#include "minuniq/errmsg.hh"
#include "minuniq/logger.hh"
#include "minuniq/macros/throw.hh"
#include "minuniq/process.hh"
#include "minuniq/script/execute_mode.hh"

#include <cerrno>
#include <csignal>
#include <exception>
#include <string>
#include <sys/capability.h>
#include <sys/prctl.h>
#include <sys/wait.h>

namespace minuniq::script {

void drop_privileges() {
    cap_t caps = cap_init();
    if (caps == nullptr) {
        THROW("cap_init()", errmsg());
    }
    if (cap_clear(caps)) {
        int errnum = errno;
        (void)cap_free(caps);
        THROW("cap_clear()", errmsg(errnum));
    }
    // Lowering capabilities is permitted even to an unprivileged process
    if (cap_set_proc(caps)) {
        int errnum = errno;
        (void)cap_free(caps);
        THROW("cap_set_proc()", errmsg(errnum));
    }
    if (cap_free(caps)) {
        THROW("cap_free()", errmsg());
    }
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        THROW("prctl(PR_SET_NO_NEW_PRIVS)", errmsg());
    }
}

int execute_mode_main(int argc, char** argv, const Registry& registry) {
    if (argc < 2) {
        errlog("path to file executed not given");
        return 1;
    }
    std::string path = argv[1];
    try {
        auto& suite = registry.detect(path);
        errlog(path, " detected as ", suite.name());
        drop_privileges();
        auto status = suite.run(path);
        if (status != ExitStatus{.code = CLD_EXITED, .status = 0}) {
            errlog("script failed: ", status.description());
        }
        return status.exit_code();
    } catch (const std::exception& e) {
        errlog("error: ", e.what());
        return 1;
    }
}

} // namespace minuniq::script
