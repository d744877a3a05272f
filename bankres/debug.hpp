#pragma once
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>

/** \file bankres/debug.hpp compile-time debug tracing
 *
 * BANKRES_DBG(a << b) and BANKRES_TDBG(a << b) write a line to stderr of the
 * form `bankres/Model.cpp:97:step(): message`, TDBG prefixing it with the local time.  They
 * compile to nothing unless built with `-DBANKRES_DEBUG` (the BANKRES_DEBUG CMake option); the
 * message expression is still type-checked either way.
 */

#ifdef BANKRES_DEBUG
#define BANKRES_DEBUG_BOOL true
#else
#define BANKRES_DEBUG_BOOL false
#endif

namespace bankres { namespace debug {

// Strips __FILE__ down to the part starting at the last "bankres/"
inline std::string source(const char *file) {
    std::string f(file);
    auto at = f.rfind("bankres/");
    return at == std::string::npos ? f : f.substr(at);
}

inline std::string timestamp() {
    std::time_t now = std::time(nullptr);
    char buf[64];
    std::strftime(buf, sizeof buf, "[%c] ", std::localtime(&now));
    return buf;
}

// Writes one complete line, so that lines from concurrent runs don't interleave mid-line
inline void emit(const std::string &prefix, const char *file, int line, const char *func, const std::string &msg) {
    std::ostringstream out;
    out << prefix << source(file) << ':' << line << ':' << func << "(): " << msg << '\n';
    std::cerr << out.str() << std::flush;
}

}}

#define _bankres_trace(prefix, stuff) do { if (BANKRES_DEBUG_BOOL) { \
    std::ostringstream _bankres_msg; _bankres_msg << stuff; \
    bankres::debug::emit(prefix, __FILE__, __LINE__, __func__, _bankres_msg.str()); } } while (0)

/// Sends `stuff` (an ostream expression such as `a << " " << b`) to stderr when debugging.
#define BANKRES_DBG(stuff) _bankres_trace(std::string(), stuff)

/// Like BANKRES_DBG, prefixed with the current date and time.
#define BANKRES_TDBG(stuff) _bankres_trace(bankres::debug::timestamp(), stuff)
