#include "droneid/utils/crc.hpp"

namespace droneid::utils {

static inline uint16_t reflect16(uint16_t x) {
    x = (x >> 8) | (x << 8);
    x = ((x & 0xF0F0u) >> 4) | ((x & 0x0F0Fu) << 4);
    x = ((x & 0xCCCCu) >> 2) | ((x & 0x3333u) << 2);
    x = ((x & 0xAAAAu) >> 1) | ((x & 0x5555u) << 1);
    return x;
}

Crc16 Crc16::droneid() {
    Crc16 c;
    c.poly   = 0x1021; // 0x11021 without the implicit x^16 term
    c.init   = 0x3692;
    c.xorout = 0x0000;
    c.ref_in = true;
    return c;
}

uint16_t Crc16::compute(const uint8_t* data, size_t len) const {
    uint16_t crc = init;
    if (ref_in) {
        const uint16_t rpoly = reflect16(poly);
        for (size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int b = 0; b < 8; ++b) {
                if (crc & 0x0001u) crc = static_cast<uint16_t>((crc >> 1) ^ rpoly);
                else               crc = static_cast<uint16_t>(crc >> 1);
            }
        }
    } else {
        for (size_t i = 0; i < len; ++i) {
            crc ^= static_cast<uint16_t>(data[i]) << 8;
            for (int b = 0; b < 8; ++b) {
                if (crc & 0x8000u) crc = static_cast<uint16_t>((crc << 1) ^ poly);
                else               crc = static_cast<uint16_t>(crc << 1);
            }
        }
    }
    crc ^= xorout;
    return crc;
}

std::pair<bool, uint16_t> Crc16::verify_with_trailer_le(const uint8_t* data, size_t len) const {
    if (len < 2) return {false, 0};
    uint16_t calc = compute(data, len - 2);
    uint16_t got  = uint16_t(data[len - 2]) | (uint16_t(data[len - 1]) << 8);
    return {calc == got, calc};
}

std::pair<uint8_t, uint8_t> Crc16::make_trailer_le(const uint8_t* data, size_t len) const {
    uint16_t c = compute(data, len);
    return {uint8_t(c & 0xFF), uint8_t((c >> 8) & 0xFF)};
}

} // namespace droneid::utils
