#pragma once

namespace ind {

struct Bands { double upper, mid, lower; };

inline double width(const Bands& b) { return b.upper - b.lower; }

} // namespace ind
