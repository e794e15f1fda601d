#include "remin/ast/ast.h"

namespace remin::ast {

std::ostream& LitExpr::stream(std::ostream& os) const { return os << sym(); }

std::ostream& ConcatExpr::stream(std::ostream& os) const {
    os << '(';
    lhs()->stream(os);
    rhs()->stream(os);
    return os << ')';
}

std::ostream& UnionExpr::stream(std::ostream& os) const {
    os << '(';
    lhs()->stream(os);
    os << '+';
    rhs()->stream(os);
    return os << ')';
}

std::ostream& StarExpr::stream(std::ostream& os) const {
    os << '(';
    body()->stream(os);
    return os << ")*";
}

std::ostream& operator<<(std::ostream& os, const Expr& expr) { return expr.stream(os); }

} // namespace remin::ast
