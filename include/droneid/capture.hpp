#pragma once

#include <array>
#include <chrono>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "droneid/constants.hpp"

namespace droneid {

using cfloat = std::complex<float>;

// One block of IQ samples acquired at a single tuned frequency. Produced by
// the capture thread and read-only once handed to a worker.
struct Capture {
    std::vector<cfloat> samples;
    double sample_rate_hz = 0.0;
    double center_freq_hz = 0.0;
    std::chrono::system_clock::time_point timestamp{};
};

// Sub-range [start, end) of the analysed sample block that looks like one
// burst, with its coarse carrier offset.
struct BurstCandidate {
    std::size_t start = 0;
    std::size_t end = 0;
    double duration_s = 0.0;  // width of the above-threshold region
    double offset_hz = 0.0;   // signal centre relative to the tuned frequency
    bool offset_valid = false;

    std::size_t length() const { return end > start ? end - start : 0; }
};

// Payload-bearing QPSK points, one inner vector per OFDM symbol, reference
// symbols already removed.
struct SymbolFrame {
    std::vector<std::vector<cfloat>> symbols;

    std::size_t point_count() const {
        std::size_t n = 0;
        for (const auto& s : symbols) n += s.size();
        return n;
    }
};

// 89-byte payload followed by the little-endian CRC-16.
using RawFrame = std::array<uint8_t, kRawFrameBytes>;

} // namespace droneid
