#include "minuniq/game/line_io.hh"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <poll.h>
#include <unistd.h>

using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

// Waits for @p events on @p fd until @p deadline. Returns false on timeout or poll() error,
// setting errno to 0 on timeout.
bool await_fd(int fd, short events, steady_clock::time_point deadline) noexcept {
    for (;;) {
        auto now = steady_clock::now();
        if (now >= deadline) {
            errno = 0;
            return false;
        }
        auto remaining = std::chrono::ceil<milliseconds>(deadline - now);
        pollfd pfd = {
            .fd = fd,
            .events = events,
            .revents = 0,
        };
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        // POLLHUP and POLLERR are reported through the subsequent read() or write()
        if (rc > 0) {
            return true;
        }
    }
}

bool is_space(char c) noexcept {
    return c == ' ' or c == '\t' or c == '\r' or c == '\n' or c == '\v' or c == '\f';
}

std::string trimmed(std::string_view str) {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return std::string{str};
}

} // namespace

namespace minuniq::game {

const char* to_string(IoError err) noexcept {
    switch (err) {
    case IoError::Timeout: return "deadline violated";
    case IoError::EndOfFile: return "end of file";
    case IoError::Failure: return "i/o error";
    case IoError::LineTooLong: return "line too long";
    }
    return "unknown error";
}

std::variant<std::string, IoError> LineReader::read_line(milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    for (;;) {
        auto nl_pos = buff_.find('\n');
        if (nl_pos != std::string::npos) {
            auto line = trimmed(std::string_view{buff_}.substr(0, nl_pos));
            buff_.erase(0, nl_pos + 1);
            return line;
        }
        if (buff_.size() > MAX_LINE_LEN) {
            return IoError::LineTooLong;
        }
        if (not fd_.is_open()) {
            return IoError::Failure;
        }
        if (not await_fd(fd_, POLLIN, deadline)) {
            return errno == 0 ? IoError::Timeout : IoError::Failure;
        }
        char chunk[512];
        auto len = read(fd_, chunk, sizeof(chunk));
        if (len == 0) {
            if (buff_.empty()) {
                return IoError::EndOfFile;
            }
            auto line = trimmed(buff_);
            buff_.clear();
            return line;
        }
        if (len == -1) {
            if (errno == EAGAIN or errno == EINTR) {
                continue;
            }
            return IoError::Failure;
        }
        buff_.append(chunk, static_cast<size_t>(len));
    }
}

void LineReader::close() noexcept {
    (void)fd_.close();
    buff_.clear();
}

LineWriter::LineWriter(FileDescriptor fd) noexcept : fd_{std::move(fd)} {
    // Writing to a competitor that closed its stdin has to fail with EPIPE instead of killing
    // the whole process
    [[maybe_unused]] static const bool sigpipe_ignored = [] {
        (void)std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
}

std::optional<IoError> LineWriter::write(std::string_view data, milliseconds timeout) {
    auto deadline = steady_clock::now() + timeout;
    while (not data.empty()) {
        if (not fd_.is_open()) {
            return IoError::Failure;
        }
        auto len = ::write(fd_, data.data(), data.size());
        if (len == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN) {
                return IoError::Failure;
            }
            // Pipe is full
            if (not await_fd(fd_, POLLOUT, deadline)) {
                return errno == 0 ? IoError::Timeout : IoError::Failure;
            }
            continue;
        }
        data.remove_prefix(static_cast<size_t>(len));
    }
    return std::nullopt;
}

void LineWriter::close() noexcept { (void)fd_.close(); }

} // namespace minuniq::game
