#pragma once
#include <array>
#include <complex>
#include <cstddef>
#include <vector>

#include "droneid/constants.hpp"

namespace droneid::rx {

// Symbol timeline of one burst at kCanonicalSampleRateHz.
struct FrameLayout {
    std::vector<std::size_t> cp_lengths;      // one per OFDM symbol
    std::size_t zc_first = 0;                 // symbol index of the root-600 reference
    std::size_t zc_second = 0;                // symbol index of the root-147 reference
    std::vector<std::size_t> payload_symbols; // data-bearing symbol indices, in order

    std::size_t symbol_count() const { return cp_lengths.size(); }
    // Sample index where symbol `i` (its cyclic prefix) begins.
    std::size_t symbol_start(std::size_t i) const;
    std::size_t total_samples() const { return symbol_start(symbol_count()); }
};

// 9-symbol frame (references at 3 and 5, symbol 0 unused) or the 8-symbol
// legacy frame (references at 2 and 4).
const FrameLayout& frame_layout(bool legacy);

// FFT bin of data carrier `k` in [0, kDataCarriers): carriers run
// -300..-1, +1..+300 and skip DC.
std::size_t carrier_bin(std::size_t k, std::size_t fft_size = kFftSize);

// x_u(n) = exp(-j*pi*u*n*(n+1)/N), n = 0..N-1.
std::vector<std::complex<float>> zadoff_chu(int root, std::size_t length = kZcLength);

// Reference sequence as mapped onto the data carriers: the middle element of
// the length-601 sequence sits on DC and is dropped.
std::vector<std::complex<float>> zc_carriers(int root);

// One useful period (no cyclic prefix) of the reference symbol, produced by
// an unnormalised inverse FFT of size `fft_size`.
std::vector<std::complex<float>> zc_time_symbol(int root, std::size_t fft_size = kFftSize);

} // namespace droneid::rx
