#include "util/ContentHasher.hpp"
#include <sstream>
#include <iomanip>
#include <openssl/sha.h>

namespace reel::util {

std::vector<uint8_t> ContentHasher::sha256(std::string_view data) {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return hash;
}

std::string ContentHasher::to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string ContentHasher::sha256_hex(std::string_view data) {
    return to_hex(sha256(data));
}

std::string ContentHasher::short_hex(std::string_view data, size_t digits) {
    std::string hex = sha256_hex(data);
    if (digits < hex.size()) {
        hex.resize(digits);
    }
    return hex;
}

}  // namespace reel::util
