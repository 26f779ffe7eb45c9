#pragma once

#include <array>
#include <vector>
#include <cstdint>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace identicon {

constexpr int HASH_SIZE = 16;
constexpr int GROUP_SIZE = 3;
constexpr int ROW_SIZE = 5;
constexpr int GRID_WIDTH = 5;
constexpr int GRID_CELLS = GRID_WIDTH * GRID_WIDTH;
constexpr int GRID_BYTES = GRID_WIDTH * GROUP_SIZE;
constexpr int CELL_SIZE = 50;
constexpr int CANVAS_SIZE = 250;

static_assert(CELL_SIZE * GRID_WIDTH == CANVAS_SIZE, "cell size and grid width must tile the canvas");
static_assert(GRID_BYTES <= HASH_SIZE, "grid consumes more bytes than the digest provides");

enum class ErrorCode {
    SUCCESS = 0,
    FILE_ERROR,
    ENCODE_ERROR,
    INVALID_INPUT
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

// Malformed intermediate data handed to a pipeline stage.
class InvalidInput : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

using HashBytes = std::array<uint8_t, HASH_SIZE>;
using Group = std::array<uint8_t, GROUP_SIZE>;
using Row = std::array<uint8_t, ROW_SIZE>;

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) : r(r), g(g), b(b), a(a) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

struct GridCell {
    uint8_t value = 0;
    int index = 0;

    bool operator==(const GridCell& other) const {
        return value == other.value && index == other.index;
    }
    bool operator!=(const GridCell& other) const { return !(*this == other); }
};

using Grid = std::vector<GridCell>;

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

struct Rectangle {
    Point top_left;
    Point bottom_right;

    int width() const { return bottom_right.x - top_left.x; }
    int height() const { return bottom_right.y - top_left.y; }

    bool operator==(const Rectangle& other) const {
        return top_left == other.top_left && bottom_right == other.bottom_right;
    }
    bool operator!=(const Rectangle& other) const { return !(*this == other); }
};

class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 4) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        return Color(data_[idx], data_[idx+1], data_[idx+2], data_[idx+3]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 4;
        data_[idx] = c.r;
        data_[idx+1] = c.g;
        data_[idx+2] = c.b;
        data_[idx+3] = c.a;
    }

    void fill(const Color& c) {
        for (int y = 0; y < height_; ++y) {
            for (int x = 0; x < width_; ++x) {
                set_pixel(x, y, c);
            }
        }
    }

    bool operator==(const FrameBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }
    bool operator!=(const FrameBuffer& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

}
