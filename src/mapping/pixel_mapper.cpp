#include "pixel_mapper.hpp"

namespace identicon {

Rectangle cell_rectangle(int index) {
    if (index < 0 || index >= GRID_CELLS) {
        throw InvalidInput("cell index " + std::to_string(index) + " outside grid of " +
                           std::to_string(GRID_CELLS) + " cells");
    }

    const int horizontal = (index % GRID_WIDTH) * CELL_SIZE;
    const int vertical = (index / GRID_WIDTH) * CELL_SIZE;

    Rectangle rect;
    rect.top_left = {horizontal, vertical};
    rect.bottom_right = {horizontal + CELL_SIZE, vertical + CELL_SIZE};
    return rect;
}

std::vector<Rectangle> build_pixel_map(const Grid& cells) {
    std::vector<Rectangle> rects;
    rects.reserve(cells.size());
    for (const auto& cell : cells) {
        rects.push_back(cell_rectangle(cell.index));
    }
    return rects;
}

}
