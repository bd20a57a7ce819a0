#pragma once

#include <minuniq/process.hh>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace minuniq::sandbox {

// Environment variable that switches the minuniq binary into the execute mode
constexpr const char EXECUTE_MODE_ENV[] = "__RUN__";

// Directory inside the container at which the script is bind mounted
constexpr const char CONTAINER_SCRIPT_DIR[] = "/src";

// Re-executes the orchestrator binary in the execute mode
struct HostDirect {
    std::string executable = "/proc/self/exe";
};

// Runs the script in a fresh container of the image that has minuniq as its entry point
struct Container {
    std::string image;
    std::string runtime = "docker";
};

using Strategy = std::variant<HostDirect, Container>;

// Container iff @p image is set
[[nodiscard]] Strategy strategy_for(const std::optional<std::string>& image);

// Full argv that runs @p script_path under @p strategy. Throws if the path has no file name
// component or cannot be resolved to an absolute path (the latter only for Container).
[[nodiscard]] std::vector<std::string>
command_line(const Strategy& strategy, const std::string& script_path);

// Starts the script with piped stdin and stdout and inherited stderr. Throws on error.
Spawned launch(const Strategy& strategy, const std::string& script_path);

} // namespace minuniq::sandbox
