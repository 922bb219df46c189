#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace droneid::utils {

/**
 * Length-`length` Gold sequence from the pair of 31-stage LFSRs
 *
 *   x1(n+31) = x1(n+3) ^ x1(n)
 *   x2(n+31) = x2(n+3) ^ x2(n+2) ^ x2(n+1) ^ x2(n)
 *
 * with x1 seeded to 1,0,0,...,0 and x2 to the 31 low bits of `seed`
 * (bit i -> x2(i)). Output is c(n) = x1(n+nc) ^ x2(n+nc); every element is
 * 0 or 1. The result depends only on (nc, length, seed).
 */
std::vector<uint8_t> gold_sequence(uint32_t nc, size_t length, uint32_t seed);

// XOR `bits` in place with gold_sequence(nc, bits.size(), seed).
void descramble(std::vector<uint8_t>& bits, uint32_t nc, uint32_t seed);

} // namespace droneid::utils
