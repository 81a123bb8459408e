#include "enginebox/logger.hh"
#include "enginebox/errmsg.hh"
#include "enginebox/macros/throw.hh"

#include <cstdio>
#include <ctime>
#include <sys/time.h>

Logger stdlog{stderr};
Logger errlog{stderr};

Logger::~Logger() {
    if (owns_stream_) {
        (void)fclose(stream_);
    }
}

void Logger::use(const std::string& path) {
    FILE* f = fopen(path.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen(\"", path, "\")", errmsg());
    }
    if (owns_stream_) {
        (void)fclose(stream_);
    }
    stream_ = f;
    owns_stream_ = true;
}

void Logger::use(FILE* stream) noexcept {
    if (owns_stream_) {
        (void)fclose(stream_);
    }
    stream_ = stream;
    owns_stream_ = false;
}

void Logger::write_line(std::string_view msg) noexcept {
    timeval tv{};
    (void)gettimeofday(&tv, nullptr);
    tm t{};
    (void)localtime_r(&tv.tv_sec, &t);
    char stamp[32];
    size_t len = strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &t);
    stamp[len] = '\0';
    // A single fprintf() keeps lines from concurrent writers whole
    (void)fprintf(
        stream_, "[ %s.%06ld ] %.*s\n", stamp, static_cast<long>(tv.tv_usec), // NOLINT
        static_cast<int>(msg.size()), msg.data());
    (void)fflush(stream_);
}
