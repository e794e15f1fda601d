#pragma once

#include <cassert>

#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

#include <fe/assert.h>

namespace remin {

/// @name Formatted Output
/// @anchor fmt
///@{
/// Puts @p s into @p os and replaces each `{}` with the next argument, streamed via `os << arg`.
/// Use `{{` or `}}` to literally output `{` or `}`:
/// ```
/// print(os, "{} -> {{{}}}", 'a', 23); // "a -> {23}"
/// ```
std::ostream& print(std::ostream& os, const char* s); ///< Base case.

template<class T, class... Args> std::ostream& print(std::ostream& os, const char* s, T&& t, Args&&... args) {
    while (*s != '\0') {
        if ((*s == '{' || *s == '}') && s[1] == *s) {
            os << *s;
            s += 2;
        } else if (*s == '{') {
            assert(s[1] == '}' && "placeholders must be '{}'");
            os << t;
            return print(os, s + 2, std::forward<Args&&>(args)...);
        } else {
            assert(*s != '}' && "unmatched/unescaped closing brace '}' in format string");
            os << *s++;
        }
    }

    assert(false && "more arguments than placeholders in format string");
    fe::unreachable();
}

/// Wraps remin::print to output a formatted `std::string`.
template<class... Args> std::string fmt(const char* s, Args&&... args) {
    std::ostringstream os;
    print(os, s, std::forward<Args&&>(args)...);
    return os.str();
}

/// remin::print to `std::cout`/`std::cerr` followed by `std::endl`.
// clang-format off
template<class... Args> std::ostream& outln(const char* fmt, Args&&... args) { return print(std::cout, fmt, std::forward<Args&&>(args)...) << std::endl; }
template<class... Args> std::ostream& errln(const char* fmt, Args&&... args) { return print(std::cerr, fmt, std::forward<Args&&>(args)...) << std::endl; }
// clang-format on
///@}

} // namespace remin
