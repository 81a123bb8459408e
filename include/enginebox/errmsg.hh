#pragma once

#include "enginebox/concat_tostr.hh"

#include <cerrno>
#include <cstring>
#include <string>

// Returns " - <errno name>: <description>" e.g. " - ENOENT: No such file or directory"
inline std::string errmsg(int errnum) {
    const char* name = strerrorname_np(errnum);
    const char* descr = strerrordesc_np(errnum);
    return concat_tostr(
        " - ", name ? name : "Unknown error", ": ", descr ? descr : "unknown description");
}

inline std::string errmsg() { return errmsg(errno); }
