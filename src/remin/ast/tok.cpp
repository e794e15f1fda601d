#include "remin/ast/tok.h"

namespace remin::ast {

const char* Tok::tag2str(Tok::Tag tag) {
    switch (tag) {
#define CODE(t, str) \
    case Tok::Tag::t: return str;
        REMIN_TOK(CODE)
#undef CODE
        default: fe::unreachable();
    }
}

std::ostream& operator<<(std::ostream& os, Tok tok) {
    if (tok.isa(Tok::Tag::M_sym)) return os << tok.sym();
    return os << Tok::tag2str(tok.tag());
}

} // namespace remin::ast
