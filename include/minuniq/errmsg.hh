#pragma once

#include <cerrno>
#include <cstring>
#include <string>

// Returns " - <errnum>: <description of errnum>"
inline std::string errmsg(int errnum) {
    auto descr = strerrordesc_np(errnum);
    return std::string{" - "} + std::to_string(errnum) + ": " + (descr ? descr : "Unknown error");
}

inline std::string errmsg() { return errmsg(errno); }
