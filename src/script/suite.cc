#include "minuniq/process.hh"
#include "minuniq/script/suite.hh"

#include <cstdlib>
#include <string_view>
#include <unistd.h>

namespace minuniq::script {

bool Suite::is_supported() const {
    auto argv = command_line("");
    return not argv.empty() and is_executable_available(argv.front());
}

ExitStatus Suite::run(const std::string& script_path) {
    auto spawned = spawn({
        .argv = command_line(script_path),
        .extra_env = {},
        .pipe_stdin = false,
        .pipe_stdout = false,
    });
    return spawned.process.wait();
}

bool is_executable_available(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return access(executable.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    std::string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    for (;;) {
        auto colon = path.find(':');
        auto dir = path.substr(0, colon);
        auto candidate = std::string{dir.empty() ? "." : dir} + '/' + executable;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
        if (colon == std::string_view::npos) {
            return false;
        }
        path.remove_prefix(colon + 1);
    }
}

} // namespace minuniq::script
