#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace reel::util {

class ContentHasher {
public:
    // SHA-256 as a 64-char lowercase hex string (content-addressed names)
    static std::string sha256_hex(std::string_view data);

    // First `digits` hex characters of sha256_hex()
    static std::string short_hex(std::string_view data, size_t digits = 8);

private:
    static std::vector<uint8_t> sha256(std::string_view data);
    static std::string to_hex(const std::vector<uint8_t>& bytes);
};

}  // namespace reel::util
