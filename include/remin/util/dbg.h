#pragma once

#include <exception>
#include <filesystem>
#include <string>

#include <fe/loc.h>
#include <rang.hpp>

#include "remin/util/print.h"

namespace remin {

namespace fs = std::filesystem;

using fe::Loc;
using fe::Pos;

/// Located diagnostic of the pattern front end; the automaton stages never produce one.
class Error : public std::exception {
public:
    Error(Loc loc, std::string msg)
        : loc_(loc)
        , msg_(std::move(msg)) {}

    Loc loc() const { return loc_; }
    const std::string& msg() const { return msg_; }
    /// Message without location or color.
    const char* what() const noexcept override { return msg_.c_str(); }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return print(os, "{}{}: {}error: {}{}", rang::fg::yellow, e.loc(), rang::fg::red, rang::fg::reset, e.msg());
    }

private:
    Loc loc_;
    std::string msg_;
};

/// `throw`s an Error with the formatted message.
template<class... Args> [[noreturn]] void error(Loc loc, const char* f, Args&&... args) {
    throw Error(loc, fmt(f, std::forward<Args&&>(args)...));
}

} // namespace remin
