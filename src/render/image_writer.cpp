#include "image_writer.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>

#include <cctype>
#include <fstream>

namespace identicon {

namespace {

bool ends_with_ci(const std::string& value, const std::string& suffix) {
    if (suffix.size() > value.size()) {
        return false;
    }
    size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        unsigned char a = static_cast<unsigned char>(value[offset + i]);
        unsigned char b = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

}

bool parse_image_format(const std::string& name, ImageFormat& out) {
    if (name == "png") {
        out = ImageFormat::Png;
        return true;
    }
    if (name == "bmp") {
        out = ImageFormat::Bmp;
        return true;
    }
    return false;
}

const char* format_extension(ImageFormat format) {
    switch (format) {
        case ImageFormat::Bmp: return ".bmp";
        case ImageFormat::Png: return ".png";
    }
    return ".png";
}

ImageFormat format_for_path(const std::string& path, ImageFormat fallback) {
    if (ends_with_ci(path, ".png")) return ImageFormat::Png;
    if (ends_with_ci(path, ".bmp")) return ImageFormat::Bmp;
    return fallback;
}

std::string output_filename(const std::string& input, ImageFormat format) {
    std::string stem = input.empty() ? "identicon" : input;
    for (char& c : stem) {
        if (c == '/' || c == '\\' || c == '\0') {
            c = '_';
        }
    }
    return stem + format_extension(format);
}

ImageWriter::ImageWriter() = default;

ImageWriter::ImageWriter(const Config& config) : config_(config) {}

void ImageWriter::set_config(const Config& config) {
    config_ = config;
}

Result ImageWriter::encode(const FrameBuffer& image, std::vector<uint8_t>& out) const {
    if (image.empty()) {
        return Result::fail(ErrorCode::INVALID_INPUT, "Cannot encode an empty image");
    }

    // The codecs expect BGR(A); the buffer is RGBA. BMP drops alpha.
    cv::Mat rgba(image.height(), image.width(), CV_8UC4, const_cast<uint8_t*>(image.data()));
    cv::Mat converted;
    std::vector<int> params;
    int conversion = cv::COLOR_RGBA2BGRA;
    if (config_.format == ImageFormat::Png) {
        params = {cv::IMWRITE_PNG_COMPRESSION, config_.png_compression};
    } else {
        conversion = cv::COLOR_RGBA2BGR;
    }

    try {
        cv::cvtColor(rgba, converted, conversion);
        std::vector<uchar> encoded;
        if (!cv::imencode(format_extension(config_.format), converted, encoded, params)) {
            return Result::fail(ErrorCode::ENCODE_ERROR,
                                std::string("Encoder rejected image as ") + format_extension(config_.format));
        }
        out.assign(encoded.begin(), encoded.end());
    } catch (const cv::Exception& e) {
        return Result::fail(ErrorCode::ENCODE_ERROR, e.what());
    }

    return Result::ok();
}

Result ImageWriter::write(const std::string& path, const FrameBuffer& image) const {
    std::vector<uint8_t> bytes;
    Result result = encode(image, bytes);
    if (result.failure()) {
        return result;
    }
    return write_file(path, bytes);
}

Result write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result::fail(ErrorCode::FILE_ERROR, "Cannot open " + path + " for writing");
    }

    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
        return Result::fail(ErrorCode::FILE_ERROR, "Failed writing " + path);
    }

    return Result::ok();
}

}
