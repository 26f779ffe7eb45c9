#pragma once

#include "core/types.hpp"
#include "render/rasterizer.hpp"
#include <string>
#include <vector>

namespace identicon {

class Pipeline {
public:
    struct Config {
        Color background{255, 255, 255, 255};
    };

    Pipeline() : Pipeline(Config{}) {}
    explicit Pipeline(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    struct Result {
        HashBytes hash{};
        Color color;
        Grid grid;
        Grid cells;
        std::vector<Rectangle> pixel_map;
        FrameBuffer image;
    };

    Result process(const std::string& input) const;

private:
    Config config_;
    Rasterizer rasterizer_;
};

}
