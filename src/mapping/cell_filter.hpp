#pragma once

#include "core/types.hpp"

namespace identicon {

// Drops odd-valued cells. Surviving cells keep their original index.
Grid filter_odd_cells(const Grid& grid);

}
