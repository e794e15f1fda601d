#pragma once

#include <cstdint>

#include <ostream>

#include <rang.hpp>

#include "remin/util/dbg.h"

namespace remin {

/// Reports on the progress of the Driver's pipeline.
/// Silent until an `std::ostream` is set; then emits every message up to the set Level.
/// @see @ref log "Logging Macros"
class Log {
public:
    enum class Level {
        Info,    ///< One line per compiled pattern.
        Verbose, ///< Size of every stage.
        Debug,   ///< Every stage in DOT.
    };

    /// @name Setters
    ///@{
    Log& set(std::ostream* ostream) {
        ostream_ = ostream;
        return *this;
    }
    Log& set(Level max_level) {
        max_level_ = max_level;
        return *this;
    }
    ///@}

    template<class... Args>
    void log(Level level, const char* file, uint16_t line, const char* fmt, Args&&... args) const {
        if (!ostream_ || level > max_level_) return;
        auto path = fs::path(file);
        print(*ostream_, "{}{}:{}{}:{} ", level2color(level), level2acro(level), rang::fg::gray, Loc(&path, line),
              rang::fg::reset);
        print(*ostream_, fmt, std::forward<Args&&>(args)...) << std::endl;
    }

    static char level2acro(Level);
    static rang::fg level2color(Level);

private:
    std::ostream* ostream_ = nullptr;
    Level max_level_       = Level::Info;
};

/// @name Logging Macros
/// @anchor log
/// They expect a `log()` in scope that yields a remin::Log.
///@{
// clang-format off
#define ILOG(...) log().log(remin::Log::Level::Info,    __FILE__, __LINE__, __VA_ARGS__)
#define VLOG(...) log().log(remin::Log::Level::Verbose, __FILE__, __LINE__, __VA_ARGS__)
/// Vaporizes to nothingness in `Release` build.
#ifndef NDEBUG
#define DLOG(...) log().log(remin::Log::Level::Debug,   __FILE__, __LINE__, __VA_ARGS__)
#else
#define DLOG(...) ((void)0)
#endif
// clang-format on
///@}

} // namespace remin
