#include "rasterizer.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace identicon {

Rasterizer::Rasterizer() = default;

Rasterizer::Rasterizer(const Color& background) : background_(background) {}

void Rasterizer::set_background(const Color& background) {
    background_ = background;
}

FrameBuffer Rasterizer::draw(const Color& color, const std::vector<Rectangle>& rects) const {
    FrameBuffer result(CANVAS_SIZE, CANVAS_SIZE, background_);

    // Wraps the buffer without copying; channel order stays RGBA.
    cv::Mat canvas(result.height(), result.width(), CV_8UC4, result.data());
    const cv::Scalar fill(color.r, color.g, color.b, color.a);

    for (const auto& rect : rects) {
        if (rect.top_left.x < 0 || rect.top_left.y < 0 ||
            rect.bottom_right.x > CANVAS_SIZE || rect.bottom_right.y > CANVAS_SIZE ||
            rect.width() < 0 || rect.height() < 0) {
            throw InvalidInput("rectangle (" + std::to_string(rect.top_left.x) + "," +
                               std::to_string(rect.top_left.y) + ")-(" +
                               std::to_string(rect.bottom_right.x) + "," +
                               std::to_string(rect.bottom_right.y) + ") outside canvas");
        }

        // cv::Rect excludes its bottom-right edge.
        cv::rectangle(canvas,
                      cv::Rect(rect.top_left.x, rect.top_left.y, rect.width(), rect.height()),
                      fill, cv::FILLED);
    }

    return result;
}

}
