#pragma once

#include <minuniq/script/suite.hh>
#include <string>
#include <utility>

namespace minuniq::script {

class Python final : public Suite {
    std::string interpreter_;

public:
    explicit Python(std::string interpreter = "python3") noexcept
    : interpreter_{std::move(interpreter)} {}

    [[nodiscard]] std::string_view name() const noexcept override { return "Python"; }

    [[nodiscard]] std::vector<std::string> extensions() const override { return {".py"}; }

    [[nodiscard]] std::vector<std::string>
    command_line(const std::string& script_path) const override {
        return {interpreter_, script_path};
    }
};

} // namespace minuniq::script
