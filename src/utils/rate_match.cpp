#include "droneid/utils/rate_match.hpp"

#include <stdexcept>

namespace droneid::utils {

namespace {

constexpr uint32_t kColumns = 32;

constexpr int8_t kNull = -1;

} // namespace

SubblockInterleaverMap make_subblock_interleaver(uint32_t n_bits) {
    if (n_bits == 0)
        throw std::invalid_argument("sub-block interleaver needs a non-empty stream");

    SubblockInterleaverMap M;
    M.n_bits  = n_bits;
    M.cols    = kColumns;
    M.rows    = (n_bits + kColumns - 1) / kColumns;
    M.n_dummy = M.cols * M.rows - n_bits;
    M.map.reserve(n_bits);

    for (uint32_t c = 0; c < M.cols; ++c) {
        for (uint32_t r = 0; r < M.rows; ++r) {
            const uint32_t natural = r * M.cols + c;
            if (natural < n_bits)
                M.map.push_back(natural);
        }
    }
    return M;
}

std::vector<uint8_t> rate_dematch(std::span<const uint8_t> bits) {
    const uint32_t n_bits = static_cast<uint32_t>(bits.size());
    if (n_bits == 0) return {};

    const uint32_t rows  = (n_bits + kColumns - 1) / kColumns;
    const uint32_t cells = rows * kColumns;

    // Row-major table; trailing cells stay NULL.
    std::vector<int8_t> table(cells, kNull);
    size_t k = 0;
    for (uint32_t c = 0; c < kColumns; ++c) {
        for (uint32_t r = 0; r < rows; ++r) {
            const uint32_t natural = r * kColumns + c;
            if (natural >= n_bits) continue;
            table[natural] = static_cast<int8_t>(bits[k++] & 0x1u);
        }
    }

    std::vector<uint8_t> out;
    out.reserve(n_bits);
    for (int8_t v : table)
        if (v != kNull) out.push_back(static_cast<uint8_t>(v));
    return out;
}

} // namespace droneid::utils
