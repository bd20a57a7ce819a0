#pragma once

#include "minuniq/concat_tostr.hh"

#include <cstdio>
#include <string>
#include <utility>

// Writes whole lines to a stream, every line is flushed immediately
class Logger {
    FILE* stream_;

public:
    explicit Logger(FILE* stream) noexcept : stream_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;
    ~Logger() = default;

    template <class... Args>
    void operator()(Args&&... args) const {
        write_line(concat_tostr(std::forward<Args>(args)..., '\n'));
    }

private:
    void write_line(const std::string& line) const noexcept;
};

extern Logger stdlog; // stdout: progress and results
extern Logger errlog; // stderr: errors
