#pragma once

#include <sstream>
#include <string>
#include <utility>

template <class... Args>
std::string concat_tostr(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return std::move(oss).str();
}
