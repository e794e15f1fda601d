#include "remin/util/print.h"

namespace remin {

std::ostream& print(std::ostream& os, const char* s) {
    for (; *s != '\0'; ++s) {
        assert((*s != '{' || s[1] == '{') && "placeholder '{}' without argument");
        assert((*s != '}' || s[1] == '}') && "unmatched/unescaped closing brace '}' in format string");
        if (*s == '{' || *s == '}') ++s; // escaped brace
        os << *s;
    }
    return os;
}

} // namespace remin
