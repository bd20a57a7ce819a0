#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minuniq {

struct Config {
    std::vector<std::string> programs; // competitor scripts, in match order
    uint32_t rounds = 0;
    std::optional<std::string> image; // if set, competitors run in containers of this image
};

// Parses a YAML document of the form:
//   programs:
//     - a.py
//     - b.py
//   rounds: 100
//   image: minuniq-runner
// where "image" is optional. Throws on error.
[[nodiscard]] Config parse_config(std::string_view yaml_text);

// Throws on error
[[nodiscard]] Config load_config(const std::string& path);

} // namespace minuniq
