#pragma once

#include "core/types.hpp"
#include <vector>

namespace identicon {

Rectangle cell_rectangle(int index);

// One CELL_SIZE square per cell, in cell order. Throws InvalidInput for an
// index outside the grid.
std::vector<Rectangle> build_pixel_map(const Grid& cells);

}
