#pragma once

#include "minuniq/file_descriptor.hh"

#include <optional>
#include <unistd.h>

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error (errno is set by pipe2(2))
[[nodiscard]] inline std::optional<Pipe> pipe2(int flags) {
    int fds[2];
    if (::pipe2(fds, flags)) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{fds[0]},
        .writable = FileDescriptor{fds[1]},
    };
}
