#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nx::util {

// ---------- Alphabet: Crockford Base32 (no I, L, O, U) - filesystem/email safe
// 32 symbols => each char encodes 5 bits
static inline constexpr char kBase32Crockford[] =
    "0123456789ABCDEFGHJKMNPQRSTVWXYZ"; // [0..31]

enum class Case { Upper, Lower };

std::string b32_crockford_encode(const uint8_t* data, size_t len, Case out_case = Case::Upper);

inline std::string b32_crockford_encode(const std::string_view s, const Case out_case = Case::Upper) {
    return b32_crockford_encode(reinterpret_cast<const uint8_t*>(s.data()), s.size(), out_case);
}

// Case-insensitive; accepts the Crockford aliases (O->0, I/L->1). nullopt on any
// other symbol or on trailing bits that do not belong to a whole byte.
std::optional<std::string> b32_crockford_decode(std::string_view encoded);

// RFC 4122 v4, lowercase hex with dashes.
std::string uuid4();

}
