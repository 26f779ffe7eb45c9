#include "cell_filter.hpp"
#include <iterator>

namespace identicon {

Grid filter_odd_cells(const Grid& grid) {
    Grid result;
    result.reserve(grid.size());
    std::copy_if(grid.begin(), grid.end(), std::back_inserter(result),
                 [](const GridCell& cell) { return cell.value % 2 == 0; });
    return result;
}

}
