#include "grid_builder.hpp"

namespace identicon {

namespace {

Grid build_grid_from(const uint8_t* bytes) {
    Grid grid;
    grid.reserve(GRID_CELLS);

    for (int group_idx = 0; group_idx < GRID_WIDTH; ++group_idx) {
        Group group;
        std::copy(bytes + group_idx * GROUP_SIZE,
                  bytes + (group_idx + 1) * GROUP_SIZE,
                  group.begin());

        Row row = mirror_row(group);
        for (uint8_t value : row) {
            grid.push_back({value, static_cast<int>(grid.size())});
        }
    }

    return grid;
}

}

Row mirror_row(const Group& group) {
    return {group[0], group[1], group[2], group[1], group[0]};
}

std::vector<uint8_t> mirror_row(const std::vector<uint8_t>& group) {
    if (group.size() < 2) {
        throw InvalidInput("mirror_row needs at least 2 elements, got " + std::to_string(group.size()));
    }

    std::vector<uint8_t> row(group);
    row.push_back(group[1]);
    row.push_back(group[0]);
    return row;
}

Grid build_grid(const HashBytes& hash) {
    return build_grid_from(hash.data());
}

Grid build_grid(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < static_cast<size_t>(GRID_BYTES)) {
        throw InvalidInput("build_grid needs at least " + std::to_string(GRID_BYTES) +
                           " bytes, got " + std::to_string(bytes.size()));
    }
    return build_grid_from(bytes.data());
}

}
