#pragma once

#include "core/types.hpp"
#include <vector>

namespace identicon {

// Leading three digest bytes become (r, g, b).
Color pick_color(const HashBytes& hash);
Color pick_color(const std::vector<uint8_t>& bytes);

}
