#pragma once

#include <array>
#include <cerrno>
#include <cstring>
#include <polyexec/concat_tostr.hh>
#include <string>

// Returns " - <description of @p errnum> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    std::array<char, 128> buff{};
    // GNU strerror_r() may or may not use the supplied buffer
    const char* errstr = strerror_r(errnum, buff.data(), buff.size());
    if (errstr == nullptr) {
        errstr = "Unknown error";
    }
    return concat_tostr(" - ", errstr, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }
