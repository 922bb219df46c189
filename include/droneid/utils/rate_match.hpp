#pragma once
#include <cstdint>
#include <span>
#include <vector>

namespace droneid::utils {

struct SubblockInterleaverMap {
    std::vector<uint32_t> map; ///< map[k] gives the natural-order index of the k-th transmitted bit
    uint32_t n_bits{};         ///< stream length without dummy positions
    uint32_t rows{};
    uint32_t cols{32};
    uint32_t n_dummy{};        ///< cols*rows - n_bits trailing NULL positions
};

/**
 * Build the systematic-stream sub-block interleaver.
 *
 * The stream is written row by row into a 32-column table of
 * ceil(n_bits / 32) rows whose last `n_dummy` cells are NULL, then read
 * column by column, skipping NULL cells.
 */
SubblockInterleaverMap make_subblock_interleaver(uint32_t n_bits);

/**
 * Undo the sub-block interleave: place the received bits back into the
 * column-major cells, then read the table row-major and strip the NULL
 * cells. The output has exactly `bits.size()` entries, none of them NULL.
 */
std::vector<uint8_t> rate_dematch(std::span<const uint8_t> bits);

} // namespace droneid::utils
