#include "core/types.hpp"
#include "core/config.hpp"
#include "core/hasher.hpp"
#include "core/pipeline.hpp"
#include "render/image_writer.hpp"
#include "cli/args.hpp"

#include <chrono>
#include <iostream>
#include <iomanip>

namespace {

void log_stages(const identicon::Pipeline::Result& result) {
    std::cerr << "[INFO] digest " << identicon::to_hex(result.hash) << "\n";
    std::cerr << "[INFO] color (" << static_cast<int>(result.color.r) << ","
              << static_cast<int>(result.color.g) << ","
              << static_cast<int>(result.color.b) << ")\n";
    std::cerr << "[INFO] " << result.cells.size() << "/" << result.grid.size()
              << " cells painted\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    identicon::Args args = identicon::parse_args(argc, argv);

    if (args.show_help) {
        identicon::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        return 1;
    }

    identicon::Config config = identicon::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = identicon::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = identicon::merge_config(config, *loaded);
    } else {
        if (auto loaded_default = identicon::Config::load_default()) {
            config = identicon::merge_config(config, *loaded_default);
        }
    }
    config = identicon::apply_cli_overrides(config, args);

    if (!args.input_set) {
        std::cerr << "Error: No input specified\n";
        identicon::print_help(argv[0]);
        return 1;
    }

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    const auto start = std::chrono::steady_clock::now();

    identicon::Pipeline::Config pipeline_cfg;
    pipeline_cfg.background = config.render.background;
    identicon::Pipeline pipeline(pipeline_cfg);

    identicon::Pipeline::Result result;
    try {
        result = pipeline.process(config.input);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to generate identicon: " << e.what() << "\n";
        return 1;
    }
    if (config.debug.print_hash) {
        std::cout << identicon::to_hex(result.hash) << "\n";
    }
    if (config.debug.verbose) {
        log_stages(result);
    }

    identicon::ImageWriter::Config writer_cfg;
    writer_cfg.format = config.resolve_format();
    identicon::ImageWriter writer(writer_cfg);

    const std::string path = config.resolve_output_path();
    identicon::Result written = writer.write(path, result.image);
    if (written.failure()) {
        std::cerr << "Error: " << written.message << "\n";
        return 1;
    }

    if (config.debug.verbose) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        std::cerr << "[INFO] wrote " << path << "\n";
        std::cerr << std::fixed << std::setprecision(2)
                  << "[PERF] total " << elapsed << " ms\n";
    }

    std::cout << path << "\n";
    return 0;
}
