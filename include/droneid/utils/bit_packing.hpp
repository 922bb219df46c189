// Helpers for packing MSB-first bit vectors into bytes and back.
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace droneid::utils {

// Pack bits (each entry 0/1) into bytes, MSB-first within each byte.
// Trailing bits that do not fill a whole byte are dropped.
inline std::vector<uint8_t> pack_bits_msb_first(const std::vector<uint8_t>& bits) {
    std::vector<uint8_t> out;
    out.reserve(bits.size() / 8);
    for (size_t i = 0; i + 8 <= bits.size(); i += 8) {
        uint8_t cur = 0;
        for (size_t b = 0; b < 8; ++b)
            cur = static_cast<uint8_t>((cur << 1) | (bits[i + b] & 1u));
        out.push_back(cur);
    }
    return out;
}

inline std::vector<uint8_t> unpack_bits_msb_first(const uint8_t* bytes, size_t len) {
    std::vector<uint8_t> bits;
    bits.reserve(len * 8);
    for (size_t i = 0; i < len; ++i)
        for (int b = 7; b >= 0; --b)
            bits.push_back(static_cast<uint8_t>((bytes[i] >> b) & 1u));
    return bits;
}

} // namespace droneid::utils
