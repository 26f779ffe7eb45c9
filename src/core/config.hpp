#pragma once

#include "core/types.hpp"
#include "render/image_writer.hpp"
#include <string>
#include <optional>

namespace identicon {

constexpr int CONFIG_VERSION = 1;

struct ConfigOutput {
    std::string directory = ".";
    std::string target;
    std::string format = "png";
};

struct ConfigRender {
    Color background{255, 255, 255, 255};
};

struct ConfigDebug {
    bool verbose = false;
    bool print_hash = false;
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigOutput output;
    ConfigRender render;
    ConfigDebug debug;

    std::string input;
    std::string config_path;

    bool validate(std::string& error) const;

    // An explicit target's suffix wins over output.format.
    ImageFormat resolve_format() const;
    // Explicit target if set, else <directory>/<derived filename>.
    std::string resolve_output_path() const;

    static Config defaults();
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config merge_config(Config base, const Config& override);
Config apply_cli_overrides(Config config, const struct Args& args);

}
