#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "braille/Geometry.hpp"

namespace braille {

// Folds a packed binary buffer (width*height bytes, 0 = off, non-zero = on)
// into Braille text: grid.rows lines of grid.cols glyphs, each ending in '\n'.
// Sample points outside the buffer are off and are not inverted.
//
// 'out' is replaced; its size is exactly textSize(grid.cols, grid.rows).
void renderBinary(const std::vector<uint8_t>& binary,
                  uint32_t width, uint32_t height,
                  const GridSize& grid, bool invert,
                  std::string& out);

} // namespace braille
