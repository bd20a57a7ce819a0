#pragma once

#include <map>
#include <memory>
#include <minuniq/script/suite.hh>
#include <string>

namespace minuniq::script {

// Maps file name extensions to the suites that run them
class Registry {
    std::map<std::string, std::shared_ptr<Suite>, std::less<>> suite_by_extension_;

public:
    // Registry knowing every suite shipped with minuniq
    static Registry with_builtin_suites();

    // Later registrations of an extension replace the earlier ones
    void add(std::shared_ptr<Suite> suite);

    // Throws if no suite runs scripts with the extension of @p script_path
    [[nodiscard]] Suite& detect(const std::string& script_path) const;
};

} // namespace minuniq::script
