#include "util/PathCodec.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>

namespace reel::util {

static bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string PathCodec::percent_encode(std::string_view raw) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(raw.size() * 3);
    for (char ch : raw) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c) || c == '/') {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string PathCodec::percent_decode(std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size());
    for (size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] == '%' && i + 2 < encoded.size()) {
            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        // Malformed escapes are kept literally
        out.push_back(encoded[i]);
    }
    return out;
}

bool PathCodec::is_encoded(std::string_view line) {
    if (line.size() < SCHEME.size()) return false;
    for (size_t i = 0; i < SCHEME.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) != SCHEME[i]) {
            return false;
        }
    }
    return true;
}

std::string PathCodec::encode(const std::filesystem::path& path) {
    std::string generic = path.generic_string();
    if (generic.empty() || generic.front() != '/') {
        // Drive-letter and relative forms still get the third slash
        generic.insert(generic.begin(), '/');
    }
    return std::string(SCHEME) + percent_encode(generic);
}

std::filesystem::path PathCodec::decode(std::string_view line) {
    if (!is_encoded(line)) {
        return std::filesystem::path(std::string(line));
    }

    std::string decoded = percent_decode(line.substr(SCHEME.size()));

    // Older writers produced file:////abs; collapse to a single leading slash
    size_t first = decoded.find_first_not_of('/');
    if (first == std::string::npos) {
        return "/";
    }
    if (first > 1) {
        decoded.erase(0, first - 1);
    }

    // /C:/dir -> C:/dir
    if (decoded.size() >= 3 && decoded[0] == '/' &&
        std::isalpha(static_cast<unsigned char>(decoded[1])) && decoded[2] == ':') {
        decoded.erase(0, 1);
    }

    return std::filesystem::path(decoded);
}

std::string PathCodec::normalize_for_compare(std::string_view path_or_line) {
    std::string key = is_encoded(path_or_line)
        ? decode(path_or_line).string()
        : std::string(path_or_line);

    std::replace(key.begin(), key.end(), '\\', '/');
    return fold_case(key);
}

bool PathCodec::same_path(std::string_view a, std::string_view b) {
    return normalize_for_compare(a) == normalize_for_compare(b);
}

}  // namespace reel::util
