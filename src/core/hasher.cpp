#include "hasher.hpp"
#include <openssl/evp.h>

#include <sstream>
#include <iomanip>

namespace identicon {

HashBytes hash_input(const std::string& input) {
    HashBytes hash{};
    unsigned int length = 0;

    if (EVP_Digest(input.data(), input.size(), hash.data(), &length, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    if (length != hash.size()) {
        throw std::runtime_error("MD5 digest returned " + std::to_string(length) + " bytes");
    }

    return hash;
}

std::string to_hex(const HashBytes& hash) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : hash) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

}
