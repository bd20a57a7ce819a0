#include "minuniq/errmsg.hh"
#include "minuniq/file_contents.hh"
#include "minuniq/file_descriptor.hh"
#include "minuniq/macros/throw.hh"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd{path.c_str(), O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    std::string res;
    char buff[1 << 14];
    for (;;) {
        auto len = read(fd, buff, sizeof(buff));
        if (len == 0) {
            break;
        }
        if (len == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read(", path, ")", errmsg());
        }
        res.append(buff, static_cast<size_t>(len));
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
    return res;
}
