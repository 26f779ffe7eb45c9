#pragma once

#include "core/types.hpp"
#include <string>

namespace identicon {

struct Args {
    std::string input;
    bool input_set = false;

    std::string output;
    std::string output_dir;
    std::string format;
    std::string config_path;

    Color background{255, 255, 255, 255};
    bool background_set = false;

    bool print_hash = false;
    bool verbose = false;

    bool show_help = false;
    std::string error;
};

bool parse_color(const std::string& s, Color& out);
Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
