#include "remin/util/dbg.h"

// fe::Loc and fe::Pos stream operators
#include <fe/loc.cpp.h>
