#pragma once

#include <minuniq/process.hh>
#include <string>
#include <string_view>
#include <vector>

namespace minuniq::script {

// An interpreter kind interface
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class Suite {
public:
    Suite() = default;

    Suite(const Suite&) = delete;
    Suite(Suite&&) noexcept = default;
    Suite& operator=(const Suite&) = delete;
    Suite& operator=(Suite&&) = delete;

    virtual ~Suite() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // File name extensions (with the leading dot) of scripts run by this suite
    [[nodiscard]] virtual std::vector<std::string> extensions() const = 0;

    // Whether the interpreter can be found
    [[nodiscard]] virtual bool is_supported() const;

    [[nodiscard]] virtual std::vector<std::string>
    command_line(const std::string& script_path) const = 0;

    // Runs the script with inherited standard streams and waits for it to finish.
    // Throws if the interpreter cannot be executed.
    virtual ExitStatus run(const std::string& script_path);
};

// Whether @p executable names an executable file, directly or through PATH
[[nodiscard]] bool is_executable_available(const std::string& executable);

} // namespace minuniq::script
