#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>

namespace droneid::utils {

// Table-free CRC-16 engine. With `ref_in` set the register shifts LSB-first
// against the bit-reversed polynomial and the initial value is loaded into
// the register unchanged, which is the convention the DroneID frame uses.
struct Crc16 {
    uint16_t poly   = 0x1021;
    uint16_t init   = 0xFFFF;
    uint16_t xorout = 0x0000;
    bool ref_in     = false;

    // Poly 0x11021 (x^16 + x^12 + x^5 + 1), init 0x3692, reflected.
    static Crc16 droneid();

    uint16_t compute(const uint8_t* data, size_t len) const;

    // Checks `len - 2` bytes against the little-endian trailer in the last two.
    // Returns {match, calculated}.
    std::pair<bool, uint16_t> verify_with_trailer_le(const uint8_t* data, size_t len) const;

    std::pair<uint8_t, uint8_t> make_trailer_le(const uint8_t* data, size_t len) const;
};

} // namespace droneid::utils
