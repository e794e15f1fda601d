#include "remin/automaton/regex2eps.h"

namespace remin::automaton {

namespace {

struct Fragment {
    StateId start;
    StateId accept;
};

class Regex2EpsConverter {
public:
    Regex2EpsConverter()
        : eps_(std::make_unique<EpsNFA>()) {}

    void convert(const ast::Expr& regex) {
        auto frag = convert_(regex);
        eps_->set_start(frag.start);
        eps_->set_accepting(frag.accept);
    }

    std::unique_ptr<EpsNFA> eps() { return std::move(eps_); }

private:
    void add_eps(StateId from, StateId to) { eps_->add_transition(from, to, Label::eps()); }

    Fragment convert_(const ast::Expr& regex) {
        if (auto lit = regex.isa<ast::LitExpr>()) {
            auto s = eps_->add_state();
            auto t = eps_->add_state();
            eps_->add_transition(s, t, Label(lit->sym()));
            return {s, t};
        } else if (auto concat = regex.isa<ast::ConcatExpr>()) {
            auto lhs = convert_(*concat->lhs());
            auto rhs = convert_(*concat->rhs());
            add_eps(lhs.accept, rhs.start);
            return {lhs.start, rhs.accept};
        } else if (auto union_ = regex.isa<ast::UnionExpr>()) {
            auto lhs = convert_(*union_->lhs());
            auto rhs = convert_(*union_->rhs());
            auto s   = eps_->add_state();
            auto t   = eps_->add_state();
            add_eps(s, lhs.start);
            add_eps(s, rhs.start);
            add_eps(lhs.accept, t);
            add_eps(rhs.accept, t);
            return {s, t};
        } else if (auto star = regex.isa<ast::StarExpr>()) {
            auto body = convert_(*star->body());
            auto s    = eps_->add_state();
            auto t    = eps_->add_state();
            add_eps(s, body.start);          // enter
            add_eps(body.accept, body.start); // loop
            add_eps(s, t);                    // skip
            add_eps(body.accept, t);          // exit
            return {s, t};
        }
        fe::unreachable();
    }

    std::unique_ptr<EpsNFA> eps_;
};

} // namespace

std::unique_ptr<EpsNFA> regex2eps(const ast::Expr& regex) {
    Regex2EpsConverter converter;
    converter.convert(regex);
    return converter.eps();
}

} // namespace remin::automaton
