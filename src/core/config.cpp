#include "core/config.hpp"
#include "cli/args.hpp"
#include "render/image_writer.hpp"
#include <toml++/toml.hpp>

#include <filesystem>
#include <cstdlib>

#ifdef _WIN32
    #include <shlobj.h>
#else
    #include <unistd.h>
    #include <pwd.h>
#endif

namespace identicon {

namespace {

std::string get_home_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_PROFILE, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* userprofile = std::getenv("USERPROFILE");
    if (userprofile) return std::string(userprofile);
    return ".";
#else
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
#endif
}

std::string get_app_data_dir() {
#ifdef _WIN32
    char path[MAX_PATH];
    if (SUCCEEDED(SHGetFolderPathA(nullptr, CSIDL_APPDATA, nullptr, 0, path))) {
        return std::string(path);
    }
    const char* appdata = std::getenv("APPDATA");
    if (appdata) return std::string(appdata);
    return get_home_dir();
#elif defined(__APPLE__)
    return get_home_dir() + "/Library/Application Support";
#else
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && *xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
#endif
}

// A missing key keeps the default; a key of the wrong type is rejected.
bool read_string(toml::node_view<toml::node> node, std::string& out) {
    if (!node) return true;
    if (!node.is_string()) return false;
    out = node.value_or(out);
    return true;
}

bool read_bool(toml::node_view<toml::node> node, bool& out) {
    if (!node) return true;
    if (!node.is_boolean()) return false;
    out = node.value_or(out);
    return true;
}

bool read_color(const toml::array& arr, Color& out) {
    if (arr.size() != 3 && arr.size() != 4) {
        return false;
    }
    int64_t values[4] = {0, 0, 0, 255};
    for (size_t i = 0; i < arr.size(); ++i) {
        auto v = arr[i].value<int64_t>();
        if (!v || *v < 0 || *v > 255) {
            return false;
        }
        values[i] = *v;
    }
    out = Color(static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]),
                static_cast<uint8_t>(values[2]), static_cast<uint8_t>(values[3]));
    return true;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/identicon";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (version != CONFIG_VERSION) {
        error = "config_version must be " + std::to_string(CONFIG_VERSION);
        return false;
    }
    ImageFormat format = ImageFormat::Png;
    if (!parse_image_format(output.format, format)) {
        error = "output.format must be 'png' or 'bmp'";
        return false;
    }
    if (output.target.empty() && output.directory.empty()) {
        error = "output.directory cannot be empty";
        return false;
    }
    if (output.target.find('\0') != std::string::npos ||
        output.directory.find('\0') != std::string::npos) {
        error = "output paths cannot contain NUL bytes";
        return false;
    }
    return true;
}

ImageFormat Config::resolve_format() const {
    ImageFormat format = ImageFormat::Png;
    parse_image_format(output.format, format);
    if (!output.target.empty()) {
        return format_for_path(output.target, format);
    }
    return format;
}

std::string Config::resolve_output_path() const {
    if (!output.target.empty()) {
        return output.target;
    }
    std::filesystem::path dir(output.directory.empty() ? "." : output.directory);
    return (dir / output_filename(input, resolve_format())).string();
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto node = tbl["config_version"]) {
            auto v = node.value<int>();
            if (!v || *v != CONFIG_VERSION) {
                return std::nullopt;
            }
        }

        if (auto output = tbl["output"]) {
            if (!read_string(output["directory"], cfg.output.directory) ||
                !read_string(output["target"], cfg.output.target) ||
                !read_string(output["format"], cfg.output.format)) {
                return std::nullopt;
            }
        }

        if (auto render = tbl["render"]) {
            if (auto node = render["background"]) {
                const toml::array* arr = node.as_array();
                if (!arr || !read_color(*arr, cfg.render.background)) {
                    return std::nullopt;
                }
            }
        }

        if (auto debug = tbl["debug"]) {
            if (!read_bool(debug["verbose"], cfg.debug.verbose) ||
                !read_bool(debug["print_hash"], cfg.debug.print_hash)) {
                return std::nullopt;
            }
        }

        std::string error;
        if (!cfg.validate(error)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error&) {
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

Config merge_config(Config base, const Config& override) {
    Config result = base;
    const Config defaults = Config::defaults();

    if (override.output.directory != defaults.output.directory)
        result.output.directory = override.output.directory;
    if (!override.output.target.empty()) result.output.target = override.output.target;
    if (override.output.format != defaults.output.format)
        result.output.format = override.output.format;

    if (override.render.background != defaults.render.background)
        result.render.background = override.render.background;

    result.debug.verbose = result.debug.verbose || override.debug.verbose;
    result.debug.print_hash = result.debug.print_hash || override.debug.print_hash;

    if (!override.input.empty()) result.input = override.input;
    if (!override.config_path.empty()) result.config_path = override.config_path;

    return result;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.input_set) config.input = args.input;
    if (!args.output.empty()) config.output.target = args.output;
    if (!args.output_dir.empty()) config.output.directory = args.output_dir;
    if (!args.format.empty()) config.output.format = args.format;
    if (!args.config_path.empty()) config.config_path = args.config_path;

    if (args.background_set) config.render.background = args.background;

    if (args.verbose) config.debug.verbose = true;
    if (args.print_hash) config.debug.print_hash = true;

    return config;
}

}
