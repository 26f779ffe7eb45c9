#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace identicon {

enum class ImageFormat {
    Png,
    Bmp
};

bool parse_image_format(const std::string& name, ImageFormat& out);
const char* format_extension(ImageFormat format);

// Picks the format from the path suffix, falling back to `fallback`.
ImageFormat format_for_path(const std::string& path, ImageFormat fallback);

// "<input>.<ext>" with path separators and NUL replaced by '_'.
std::string output_filename(const std::string& input, ImageFormat format);

class ImageWriter {
public:
    struct Config {
        ImageFormat format = ImageFormat::Png;
        int png_compression = 3;
    };

    ImageWriter();
    explicit ImageWriter(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    Result encode(const FrameBuffer& image, std::vector<uint8_t>& out) const;
    Result write(const std::string& path, const FrameBuffer& image) const;

private:
    Config config_;
};

Result write_file(const std::string& path, const std::vector<uint8_t>& bytes);

}
