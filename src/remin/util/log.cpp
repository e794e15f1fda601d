#include "remin/util/log.h"

namespace remin {

// clang-format off
char Log::level2acro(Level level) {
    switch (level) {
        case Level::Info:    return 'I';
        case Level::Verbose: return 'V';
        case Level::Debug:   return 'D';
        default: fe::unreachable();
    }
}

rang::fg Log::level2color(Level level) {
    switch (level) {
        case Level::Info:    return rang::fg::green;
        case Level::Verbose: return rang::fg::cyan;
        case Level::Debug:   return rang::fg::yellow;
        default: fe::unreachable();
    }
}
// clang-format on

} // namespace remin
