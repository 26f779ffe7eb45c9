#pragma once

#include "core/types.hpp"
#include <vector>

namespace identicon {

class Rasterizer {
public:
    Rasterizer();
    explicit Rasterizer(const Color& background);

    void set_background(const Color& background);
    const Color& background() const { return background_; }

    FrameBuffer draw(const Color& color, const std::vector<Rectangle>& rects) const;

private:
    Color background_{255, 255, 255, 255};
};

}
