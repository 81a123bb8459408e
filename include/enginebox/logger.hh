#pragma once

#include "enginebox/concat_tostr.hh"

#include <cstdio>
#include <string>
#include <string_view>

// Line-oriented logger; every call produces exactly one timestamped line
class Logger {
    FILE* stream_;
    bool owns_stream_ = false;

public:
    explicit Logger(FILE* stream) noexcept : stream_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger();

    // Redirects the log to the file at @p path (opened for appending), throws on error
    void use(const std::string& path);

    // Redirects the log to @p stream, which is not closed by the logger
    void use(FILE* stream) noexcept;

    template <class... Args>
    void operator()(const Args&... args) {
        write_line(concat_tostr(args...));
    }

private:
    void write_line(std::string_view msg) noexcept;
};

// Informational messages
extern Logger stdlog;
// Errors that do not interrupt the program
extern Logger errlog;
