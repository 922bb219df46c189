#include "droneid/utils/gold.hpp"

namespace droneid::utils {

std::vector<uint8_t> gold_sequence(uint32_t nc, size_t length, uint32_t seed) {
    const size_t total = static_cast<size_t>(nc) + length;
    std::vector<uint8_t> x1(total + 31, 0);
    std::vector<uint8_t> x2(total + 31, 0);

    x1[0] = 1;
    for (int i = 0; i < 31; ++i)
        x2[i] = static_cast<uint8_t>((seed >> i) & 0x1u);

    for (size_t n = 0; n < total; ++n) {
        x1[n + 31] = static_cast<uint8_t>(x1[n + 3] ^ x1[n]);
        x2[n + 31] = static_cast<uint8_t>(x2[n + 3] ^ x2[n + 2] ^ x2[n + 1] ^ x2[n]);
    }

    std::vector<uint8_t> c(length);
    for (size_t n = 0; n < length; ++n)
        c[n] = static_cast<uint8_t>(x1[n + nc] ^ x2[n + nc]);
    return c;
}

void descramble(std::vector<uint8_t>& bits, uint32_t nc, uint32_t seed) {
    const auto mask = gold_sequence(nc, bits.size(), seed);
    for (size_t i = 0; i < bits.size(); ++i)
        bits[i] = static_cast<uint8_t>((bits[i] ^ mask[i]) & 0x1u);
}

} // namespace droneid::utils
