#pragma once

#include "core/types.hpp"
#include <vector>

namespace identicon {

// [a, b, c] -> [a, b, c, b, a]
Row mirror_row(const Group& group);

// General form: appends the second and first elements to the group.
// Throws InvalidInput for fewer than two elements.
std::vector<uint8_t> mirror_row(const std::vector<uint8_t>& group);

// Builds the 25-cell grid from the first 15 digest bytes. The 16th byte is
// never read.
Grid build_grid(const HashBytes& hash);
Grid build_grid(const std::vector<uint8_t>& bytes);

}
