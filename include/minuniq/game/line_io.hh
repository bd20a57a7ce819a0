#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <minuniq/file_descriptor.hh>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace minuniq::game {

enum class IoError : uint8_t {
    Timeout,
    EndOfFile,
    Failure,
    LineTooLong,
};

[[nodiscard]] const char* to_string(IoError err) noexcept;

// Reads newline-terminated lines from a non-blocking file descriptor within a deadline
class LineReader {
    FileDescriptor fd_;
    std::string buff_;

public:
    static constexpr size_t MAX_LINE_LEN = 4096;

    explicit LineReader(FileDescriptor fd) noexcept : fd_{std::move(fd)} {}

    // Returns the next line with the terminator and the surrounding whitespace removed. Data
    // left unterminated at the end of file is returned as the last line.
    [[nodiscard]] std::variant<std::string, IoError> read_line(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_open() const noexcept { return fd_.is_open(); }

    // Every later read fails
    void close() noexcept;
};

// Writes to a non-blocking file descriptor within a deadline
class LineWriter {
    FileDescriptor fd_;

public:
    explicit LineWriter(FileDescriptor fd) noexcept;

    // Writes the whole @p data, returns std::nullopt on success. After an error a prefix of
    // @p data may have been written.
    [[nodiscard]] std::optional<IoError>
    write(std::string_view data, std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_open() const noexcept { return fd_.is_open(); }

    // Every later write fails, the reading end sees end of file
    void close() noexcept;
};

} // namespace minuniq::game
