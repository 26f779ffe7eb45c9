#pragma once

#include "core/types.hpp"
#include <string>

namespace identicon {

HashBytes hash_input(const std::string& input);
std::string to_hex(const HashBytes& hash);

}
