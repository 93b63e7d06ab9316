#include "util/uuid.hpp"

#include <algorithm>
#include <cctype>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace nx::util {

std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case) {
    if (len == 0) return {};
    // 5-bit packing
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            const uint8_t idx = (buffer >> bits) & 0x1F;
            out.push_back(kBase32Crockford[idx]);
        }
    }
    if (bits > 0) {
        const uint8_t idx = (buffer << (5 - bits)) & 0x1F;
        out.push_back(kBase32Crockford[idx]);
    }
    if (out_case == Case::Lower) {
        std::ranges::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    }
    return out;
}

static int b32_value(const char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'O': return 0;
        case 'I':
        case 'L': return 1;
        default: break;
    }
    const auto up = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    for (int i = 0; i < 32; ++i)
        if (kBase32Crockford[i] == up) return i;
    return -1;
}

std::optional<std::string> b32_crockford_decode(const std::string_view encoded) {
    std::string out;
    out.reserve(encoded.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;

    for (const char c : encoded) {
        const int v = b32_value(c);
        if (v < 0) return std::nullopt;
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }

    // leftover must be padding zeros shorter than a byte
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) return std::nullopt;
    return out;
}

std::string uuid4() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

}
