#pragma once
#include <array>
#include <complex>
#include <cstdint>
#include <optional>
#include <vector>

#include "droneid/capture.hpp"
#include "droneid/frame/telemetry.hpp"

namespace droneid::rx {

inline constexpr int kPhaseHypotheses = 4;

// Quadrant index of a point: 0 (+,+), 1 (+,-), 2 (-,-), 3 (-,+). Zero counts
// as positive.
int qpsk_quadrant(std::complex<float> p);

// Bit pair (first bit in bit 1) for quadrant `q` under hypothesis `phase`.
// Throws std::out_of_range for a phase outside 0..3.
uint8_t qpsk_bits(int quadrant, int phase);

// Hard QPSK decisions for every point of `frame`, in symbol order, two bits
// per point.
std::vector<uint8_t> get_symbol_bits(const SymbolFrame& frame, int phase);

// Rate de-match, descramble and pack the systematic part of `raw_bits`.
// std::nullopt when fewer than kSystematicBits bits are available.
std::optional<RawFrame> bits_to_frame(const std::vector<uint8_t>& raw_bits);

struct PhaseDecodeResult {
    int phase = -1;
    RawFrame raw{};
    frame::TelemetryRecord record;
};

// Try the phase hypotheses in increasing order. By default the first phase
// that yields a parseable frame wins whatever its CRC says; with
// `prefer_crc_valid` all four are tried and the first CRC-valid one is
// preferred over the first parseable one. std::nullopt when no phase parses.
std::optional<PhaseDecodeResult> decode_phases(const SymbolFrame& frame,
                                               bool prefer_crc_valid = false);

} // namespace droneid::rx
