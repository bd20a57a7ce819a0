#include "minuniq/logger.hh"

#include <cstdio>

Logger stdlog{stdout};
Logger errlog{stderr};

void Logger::write_line(const std::string& line) const noexcept {
    // Nothing sensible can be done if logging fails
    (void)fwrite(line.data(), 1, line.size(), stream_);
    (void)fflush(stream_);
}
