#include "minuniq/concat_tostr.hh"
#include "minuniq/errmsg.hh"
#include "minuniq/macros/throw.hh"
#include "minuniq/overloaded.hh"
#include "minuniq/process.hh"
#include "minuniq/sandbox/launcher.hh"

#include <cstdlib>
#include <filesystem>
#include <memory>

namespace {

std::string absolute_path(const std::string& path) {
    std::unique_ptr<char, decltype(&free)> resolved{realpath(path.c_str(), nullptr), free};
    if (not resolved) {
        THROW("failed to resolve full path of ", path, errmsg());
    }
    return resolved.get();
}

} // namespace

namespace minuniq::sandbox {

Strategy strategy_for(const std::optional<std::string>& image) {
    if (image) {
        return Container{.image = *image};
    }
    return HostDirect{};
}

std::vector<std::string> command_line(const Strategy& strategy, const std::string& script_path) {
    auto file_name = std::filesystem::path{script_path}.filename();
    if (file_name.empty()) {
        THROW("path does not contain file name: ", script_path);
    }
    return std::visit(
        overloaded{
            [&](const HostDirect& host) -> std::vector<std::string> {
                return {host.executable, script_path};
            },
            [&](const Container& container) -> std::vector<std::string> {
                auto inner_path = (std::filesystem::path{CONTAINER_SCRIPT_DIR} / file_name).string();
                return {
                    container.runtime,
                    "run",
                    "--interactive",
                    "--rm",
                    concat_tostr("--env=", EXECUTE_MODE_ENV, "=1"),
                    concat_tostr(
                        "--mount=type=bind,source=", absolute_path(script_path),
                        ",target=", inner_path, ",readonly=true"),
                    container.image,
                    inner_path,
                };
            },
        },
        strategy
    );
}

Spawned launch(const Strategy& strategy, const std::string& script_path) {
    return spawn({
        .argv = command_line(strategy, script_path),
        .extra_env = {concat_tostr(EXECUTE_MODE_ENV, "=1")},
        .pipe_stdin = true,
        .pipe_stdout = true,
    });
}

} // namespace minuniq::sandbox
