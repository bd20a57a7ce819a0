#include "minuniq/macros/throw.hh"
#include "minuniq/script/python.hh"
#include "minuniq/script/registry.hh"

#include <filesystem>
#include <utility>

namespace minuniq::script {

Registry Registry::with_builtin_suites() {
    Registry reg;
    reg.add(std::make_shared<Python>());
    return reg;
}

void Registry::add(std::shared_ptr<Suite> suite) {
    for (auto& ext : suite->extensions()) {
        suite_by_extension_.insert_or_assign(std::move(ext), suite);
    }
}

Suite& Registry::detect(const std::string& script_path) const {
    auto ext = std::filesystem::path{script_path}.extension().string();
    auto it = suite_by_extension_.find(ext);
    if (ext.empty() or it == suite_by_extension_.end()) {
        THROW("could not detect code kind for ", script_path);
    }
    return *it->second;
}

} // namespace minuniq::script
