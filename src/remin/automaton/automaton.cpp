#include "remin/automaton/automaton.h"

namespace remin::automaton {

std::ostream& escape(std::ostream& os, Symbol sym) {
    switch (sym) {
        case '"': return os << "\\\"";
        case '\\': return os << "\\\\";
        default: return os << sym;
    }
}

std::ostream& operator<<(std::ostream& os, Label label) {
    if (label.is_eps()) return os << "ε";
    return escape(os, label.sym());
}

} // namespace remin::automaton
