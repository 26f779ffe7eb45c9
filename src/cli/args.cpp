#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <sstream>

namespace identicon {

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

// Consumes the value following argv[i]. Sets args.error when it is absent or empty.
static bool take_value(int argc, char* argv[], int& i, std::string& out, Args& args) {
    const char* option = argv[i];
    if (i + 1 >= argc) {
        args.error = std::string("Missing value for ") + option;
        return false;
    }
    std::string value = argv[++i];
    if (!validate_path(value)) {
        args.error = std::string("Empty value for ") + option;
        return false;
    }
    out = value;
    return true;
}

bool parse_color(const std::string& s, Color& out) {
    std::istringstream ss(s);
    std::string part;
    int values[4] = {0, 0, 0, 255};
    int count = 0;

    while (std::getline(ss, part, ',')) {
        if (count >= 4 || part.empty()) return false;
        char* end = nullptr;
        long v = std::strtol(part.c_str(), &end, 10);
        if (*end != '\0' || v < 0 || v > 255) return false;
        values[count++] = static_cast<int>(v);
    }
    if (count != 3 && count != 4) return false;

    out = Color(static_cast<uint8_t>(values[0]), static_cast<uint8_t>(values[1]),
                static_cast<uint8_t>(values[2]), static_cast<uint8_t>(values[3]));
    return true;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || arg[1] == '\0') {
            if (args.input_set) {
                args.error = std::string("Unexpected extra argument: ") + arg;
                return args;
            }
            args.input = arg;
            args.input_set = true;
            continue;
        }

        if (strcmp(arg, "--") == 0) {
            options_done = true;
        }
        else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }
        else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!take_value(argc, argv, i, args.output, args)) return args;
        }
        else if (strcmp(arg, "-d") == 0 || strcmp(arg, "--output-dir") == 0) {
            if (!take_value(argc, argv, i, args.output_dir, args)) return args;
        }
        else if (strcmp(arg, "--format") == 0) {
            std::string fmt;
            if (!take_value(argc, argv, i, fmt, args)) return args;
            if (fmt != "png" && fmt != "bmp") {
                args.error = "Unknown format: " + fmt;
                return args;
            }
            args.format = fmt;
        }
        else if (strcmp(arg, "--background") == 0) {
            std::string value;
            if (!take_value(argc, argv, i, value, args)) return args;
            if (!parse_color(value, args.background)) {
                args.error = "Invalid background color: " + value;
                return args;
            }
            args.background_set = true;
        }
        else if (strcmp(arg, "--config") == 0) {
            if (!take_value(argc, argv, i, args.config_path, args)) return args;
        }
        else if (strcmp(arg, "--print-hash") == 0) {
            args.print_hash = true;
        }
        else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            args.verbose = true;
        }
        else {
            args.error = std::string("Unknown option: ") + arg;
            return args;
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] [--] <INPUT>\n\n", prog);
    printf("INPUT:\n");
    printf("  Any string; the same string always yields the same 250x250 image.\n");
    printf("  Use -- before inputs that start with '-' or to pass an empty string.\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --output <FILE>       Output file (default: <INPUT>.png in the output directory)\n");
    printf("  -d, --output-dir <DIR>    Directory for derived filenames (default: .)\n");
    printf("      --format <NAME>       Image format: png, bmp (default: png)\n");
    printf("      --background <R,G,B>  Background color, optional fourth alpha component\n");
    printf("      --config <FILE>       Config file path (default: platform-specific)\n");
    printf("      --print-hash          Print the MD5 digest of INPUT as hex\n");
    printf("  -v, --verbose             Log each pipeline stage to stderr\n");
    printf("  -h, --help                Show this help\n");
    printf("\nCONFIG FILE:\n");
    printf("  Default locations:\n");
    printf("    Linux:   ~/.config/identicon/config.toml\n");
    printf("    macOS:   ~/Library/Application Support/identicon/config.toml\n");
    printf("    Windows: %%APPDATA%%\\identicon\\config.toml\n");
}

}
