#pragma once

// ============================================================
// platform.hpp -- Portable types and OS identification
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#else // POSIX
#  include <sys/utsname.h>
#  include <csignal>
#endif

namespace platform {

// Short OS descriptor used in the default User-Agent, e.g. "Linux 6.1.0"
inline std::string os_name() {
#ifdef _WIN32
    return "Windows";
#else
    struct utsname u{};
    if (uname(&u) != 0) return "Unknown";
    return std::string(u.sysname) + " " + u.release;
#endif
}

// Writing to a socket the peer already closed must surface as an error
// return, not kill the process.
inline void ignore_sigpipe() {
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
