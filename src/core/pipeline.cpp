#include "pipeline.hpp"
#include "core/hasher.hpp"
#include "mapping/color_picker.hpp"
#include "mapping/grid_builder.hpp"
#include "mapping/cell_filter.hpp"
#include "mapping/pixel_mapper.hpp"

namespace identicon {

Pipeline::Pipeline(const Config& config) : config_(config), rasterizer_(config.background) {}

void Pipeline::set_config(const Config& config) {
    config_ = config;
    rasterizer_.set_background(config.background);
}

Pipeline::Result Pipeline::process(const std::string& input) const {
    Result result;
    result.hash = hash_input(input);
    result.color = pick_color(result.hash);
    result.grid = build_grid(result.hash);
    result.cells = filter_odd_cells(result.grid);
    result.pixel_map = build_pixel_map(result.cells);
    result.image = rasterizer_.draw(result.color, result.pixel_map);
    return result;
}

}
