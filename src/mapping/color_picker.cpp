#include "color_picker.hpp"

namespace identicon {

Color pick_color(const HashBytes& hash) {
    return Color(hash[0], hash[1], hash[2]);
}

Color pick_color(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 3) {
        throw InvalidInput("pick_color needs at least 3 bytes, got " + std::to_string(bytes.size()));
    }
    return Color(bytes[0], bytes[1], bytes[2]);
}

}
