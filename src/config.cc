#include "minuniq/config.hh"
#include "minuniq/file_contents.hh"
#include "minuniq/macros/throw.hh"

#include <charconv>
#include <exception>
#include <yaml-cpp/yaml.h>

namespace {

uint32_t parse_rounds(const YAML::Node& node) {
    if (not node or not node.IsScalar()) {
        THROW("\"rounds\" has to be a non-negative 32-bit integer");
    }
    const auto& str = node.Scalar();
    uint32_t rounds{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), rounds);
    if (str.empty() or ec != std::errc{} or ptr != str.data() + str.size()) {
        THROW("\"rounds\" has to be a non-negative 32-bit integer, got: ", str);
    }
    return rounds;
}

} // namespace

namespace minuniq {

Config parse_config(std::string_view yaml_text) {
    try {
        const YAML::Node doc = YAML::Load(std::string{yaml_text});
        if (not doc.IsMap()) {
            THROW("config has to be a mapping");
        }
        Config config;
        auto programs = doc["programs"];
        if (not programs or not programs.IsSequence()) {
            THROW("\"programs\" has to be a list of script paths");
        }
        for (const auto& program : programs) {
            if (not program.IsScalar()) {
                THROW("\"programs\" has to be a list of script paths");
            }
            config.programs.emplace_back(program.Scalar());
        }
        if (config.programs.empty()) {
            THROW("\"programs\" cannot be empty");
        }
        config.rounds = parse_rounds(doc["rounds"]);
        if (auto image = doc["image"]; image and not image.IsNull()) {
            if (not image.IsScalar()) {
                THROW("\"image\" has to be a string");
            }
            config.image = image.Scalar();
        }
        return config;
    } catch (const YAML::Exception& e) {
        THROW("invalid config: ", e.what());
    }
}

Config load_config(const std::string& path) {
    try {
        return parse_config(get_file_contents(path));
    } catch (const std::exception& e) {
        THROW("failed to load config ", path, ": ", e.what());
    }
}

} // namespace minuniq
