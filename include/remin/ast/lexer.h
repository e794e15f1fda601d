#pragma once

#include <cstdint>

#include <limits>
#include <string_view>

#include "remin/ast/tok.h"

namespace remin::ast {

/// Splits a pattern into Tok%ens.
/// Literals are ASCII letters and digits; whitespace is skipped.
/// The whole pattern lives on row 1; columns count characters starting at 1.
class Lexer {
public:
    /// Longest supported pattern; the column of the final Tok::Tag::EoF must still fit into a Pos.
    static constexpr size_t Max_Length = std::numeric_limits<uint16_t>::max() - 1;

    /// `throw`s if @p pattern exceeds Max_Length.
    Lexer(std::string_view pattern, const fs::path* path = nullptr);

    Loc loc() const { return {path_, pos()}; }

    /// Yields Tok::Tag::EoF once the pattern is exhausted; keeps doing so on further calls.
    Tok lex();

private:
    Pos pos() const { return {1, static_cast<uint16_t>(i_ + 1)}; }
    Tok tok(Tok::Tag tag) { return {loc(), tag}; }

    std::string_view pattern_;
    const fs::path* path_;
    size_t i_ = 0;
};

} // namespace remin::ast
