#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../src/core/types.hpp"
#include "../src/core/pipeline.hpp"
#include "../src/mapping/pixel_mapper.hpp"
#include "../src/render/image_writer.hpp"

using namespace identicon;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static const Color WHITE(255, 255, 255);

static bool is_painted_index(const Grid& cells, int index) {
    for (const auto& cell : cells) {
        if (cell.index == index) return true;
    }
    return false;
}

TEST(pipeline_known_vector) {
    Pipeline pipeline;
    auto result = pipeline.process("identicon");

    assert(result.color == Color(173, 43, 65));
    assert(result.grid.size() == 25);
    assert(result.cells.size() == 9);
    assert(result.pixel_map.size() == 9);
    assert(result.image.width() == 250 && result.image.height() == 250);

    for (int index = 0; index < GRID_CELLS; ++index) {
        Rectangle r = cell_rectangle(index);
        Color expected = is_painted_index(result.cells, index) ? result.color : WHITE;
        assert(result.image.get_pixel(r.top_left.x, r.top_left.y) == expected);
        assert(result.image.get_pixel(r.bottom_right.x - 1, r.bottom_right.y - 1) == expected);
        assert(result.image.get_pixel(r.top_left.x + 25, r.top_left.y + 25) == expected);
    }
}

TEST(pipeline_deterministic) {
    Pipeline first;
    Pipeline second;
    const char* inputs[] = {"", "identicon", "elixir", "banana", "a much longer input string"};
    for (const char* s : inputs) {
        auto a = first.process(s);
        auto b = second.process(s);
        assert(a.image == b.image);
        assert(a.hash == b.hash);
        assert(a.pixel_map == b.pixel_map);
    }
    assert(first.process("identicon").image != first.process("Identicon").image);
}

TEST(pipeline_empty_string) {
    Pipeline pipeline;
    auto result = pipeline.process("");

    assert(result.color == Color(212, 29, 140));
    assert(result.grid.size() == 25);
    assert(result.cells.size() == 16);
    assert(result.image.width() == 250 && result.image.height() == 250);
    assert(result.image.get_pixel(0, 0) == result.color);
    assert(result.image.get_pixel(50, 0) == WHITE);
}

TEST(pipeline_horizontal_symmetry) {
    Pipeline pipeline;
    const char* inputs[] = {"", "identicon", "mirror", "symmetry"};
    for (const char* s : inputs) {
        auto result = pipeline.process(s);
        for (int y = 0; y < CANVAS_SIZE; y += 7) {
            for (int x = 0; x < CANVAS_SIZE; x += 7) {
                assert(result.image.get_pixel(x, y) == result.image.get_pixel(CANVAS_SIZE - 1 - x, y));
            }
        }
    }
}

TEST(pipeline_custom_background) {
    Pipeline::Config cfg;
    cfg.background = Color(0, 0, 0, 0);
    Pipeline pipeline(cfg);
    auto result = pipeline.process("identicon");
    assert(result.image.get_pixel(0, 0) == Color(0, 0, 0, 0));
    assert(result.image.get_pixel(60, 60) == Color(173, 43, 65));
}

TEST(pipeline_set_config_background) {
    Pipeline pipeline;
    assert(pipeline.process("identicon").image.get_pixel(0, 0) == WHITE);

    Pipeline::Config cfg;
    cfg.background = Color(0, 0, 0, 0);
    pipeline.set_config(cfg);
    assert(pipeline.config().background == Color(0, 0, 0, 0));

    auto result = pipeline.process("identicon");
    assert(result.image.get_pixel(0, 0) == Color(0, 0, 0, 0));
    assert(result.image.get_pixel(60, 60) == Color(173, 43, 65));
}

TEST(png_encode_decodes_to_same_pixels) {
    Pipeline pipeline;
    auto result = pipeline.process("identicon");

    ImageWriter writer;
    std::vector<uint8_t> bytes;
    Result encoded = writer.encode(result.image, bytes);
    assert(encoded.success());
    assert(bytes.size() > 8);
    assert(bytes[0] == 0x89 && bytes[1] == 'P' && bytes[2] == 'N' && bytes[3] == 'G');

    cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    assert(decoded.rows == 250 && decoded.cols == 250);
    assert(decoded.channels() == 4);

    for (int y = 0; y < 250; y += 5) {
        for (int x = 0; x < 250; x += 5) {
            cv::Vec4b px = decoded.at<cv::Vec4b>(y, x);
            Color expected = result.image.get_pixel(x, y);
            assert(px[2] == expected.r);
            assert(px[1] == expected.g);
            assert(px[0] == expected.b);
            assert(px[3] == expected.a);
        }
    }
}

TEST(bmp_encode_header) {
    ImageWriter::Config cfg;
    cfg.format = ImageFormat::Bmp;
    ImageWriter writer(cfg);

    std::vector<uint8_t> bytes;
    Result encoded = writer.encode(FrameBuffer(250, 250, WHITE), bytes);
    assert(encoded.success());
    assert(bytes.size() > 2 && bytes[0] == 'B' && bytes[1] == 'M');
}

TEST(writer_set_config_switches_format) {
    ImageWriter writer;
    std::vector<uint8_t> bytes;
    assert(writer.encode(FrameBuffer(250, 250, WHITE), bytes).success());
    assert(bytes[0] == 0x89 && bytes[1] == 'P');

    ImageWriter::Config cfg;
    cfg.format = ImageFormat::Bmp;
    writer.set_config(cfg);
    assert(writer.config().format == ImageFormat::Bmp);

    bytes.clear();
    assert(writer.encode(FrameBuffer(250, 250, WHITE), bytes).success());
    assert(bytes.size() > 2 && bytes[0] == 'B' && bytes[1] == 'M');
}

TEST(encode_empty_image_fails) {
    ImageWriter writer;
    std::vector<uint8_t> bytes;
    Result encoded = writer.encode(FrameBuffer(), bytes);
    assert(encoded.failure());
    assert(encoded.error == ErrorCode::INVALID_INPUT);
}

TEST(output_filename_derivation) {
    assert(output_filename("identicon", ImageFormat::Png) == "identicon.png");
    assert(output_filename("alice", ImageFormat::Bmp) == "alice.bmp");
    assert(output_filename("", ImageFormat::Png) == "identicon.png");
    assert(output_filename("a/b\\c", ImageFormat::Png) == "a_b_c.png");
    assert(output_filename(std::string("x\0y", 3), ImageFormat::Png) == "x_y.png");
}

TEST(format_selection) {
    ImageFormat fmt = ImageFormat::Bmp;
    assert(parse_image_format("png", fmt) && fmt == ImageFormat::Png);
    assert(parse_image_format("bmp", fmt) && fmt == ImageFormat::Bmp);
    assert(!parse_image_format("gif", fmt));
    assert(format_for_path("out.PNG", ImageFormat::Bmp) == ImageFormat::Png);
    assert(format_for_path("out.bmp", ImageFormat::Png) == ImageFormat::Bmp);
    assert(format_for_path("out", ImageFormat::Bmp) == ImageFormat::Bmp);
}

TEST(writer_round_trip_file) {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "identicon_writer_test";
    fs::create_directories(dir);

    Pipeline pipeline;
    auto result = pipeline.process("identicon");

    fs::path path = dir / output_filename("identicon", ImageFormat::Png);
    ImageWriter writer;
    Result written = writer.write(path.string(), result.image);
    assert(written.success());
    assert(fs::exists(path));

    std::ifstream in(path, std::ios::binary);
    std::vector<uint8_t> on_disk((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<uint8_t> encoded;
    assert(writer.encode(result.image, encoded).success());
    assert(on_disk == encoded);

    fs::remove_all(dir);
}

TEST(writer_reports_unwritable_path) {
    namespace fs = std::filesystem;
    fs::path missing = fs::temp_directory_path() / "identicon_no_such_dir" / "nested" / "out.png";
    fs::remove_all(fs::temp_directory_path() / "identicon_no_such_dir");

    Result written = write_file(missing.string(), std::vector<uint8_t>{1, 2, 3});
    assert(written.failure());
    assert(written.error == ErrorCode::FILE_ERROR);
    assert(written.message.find("out.png") != std::string::npos);
}

int main() {
    std::cout << "=== Identicon Integration Test Suite ===\n\n";

    RUN_TEST(pipeline_known_vector);
    RUN_TEST(pipeline_deterministic);
    RUN_TEST(pipeline_empty_string);
    RUN_TEST(pipeline_horizontal_symmetry);
    RUN_TEST(pipeline_custom_background);
    RUN_TEST(pipeline_set_config_background);
    RUN_TEST(png_encode_decodes_to_same_pixels);
    RUN_TEST(bmp_encode_header);
    RUN_TEST(writer_set_config_switches_format);
    RUN_TEST(encode_empty_image_fails);
    RUN_TEST(output_filename_derivation);
    RUN_TEST(format_selection);
    RUN_TEST(writer_round_trip_file);
    RUN_TEST(writer_reports_unwritable_path);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll integration tests passed.\n";
        return 0;
    }

    std::cout << "\nSome integration tests failed.\n";
    return 1;
}
