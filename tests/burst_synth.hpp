// Test-only transmitter: builds DroneID bursts for a known frame so the
// receive chain can be exercised end to end.
#pragma once
#include <complex>
#include <cstdint>
#include <vector>

#include "droneid/capture.hpp"
#include "droneid/frame/telemetry.hpp"

namespace droneid::test {

struct SynthOptions {
    double sample_rate_hz = 30.72e6;  // integer multiple of 15.36 MHz
    double cfo_hz = 0.0;
    double phase_rad = 0.0;
    double snr_db = 25.0;             // burst power over noise power
    double capture_s = 10e-3;
    std::vector<double> burst_times_s = {2e-3};
    bool legacy = false;
    uint32_t noise_seed = 7;
};

// Frame fields with plausible values and a readable serial/uuid.
frame::TelemetryFields sample_fields();

// Inverse of the receive bit path: pad to the systematic length, scramble,
// sub-block interleave and repeat up to kRawBitsPerFrame.
std::vector<uint8_t> frame_to_raw_bits(const RawFrame& frame);

// Phase-0 QPSK points for `raw_bits`, kDataCarriers per symbol.
SymbolFrame bits_to_symbols(const std::vector<uint8_t>& raw_bits);

// One burst (no noise, unit average power) at `sample_rate_hz`.
std::vector<cfloat> synth_burst(const RawFrame& frame, double sample_rate_hz, bool legacy = false);

// Noise-only block with the given average power.
std::vector<cfloat> noise(std::size_t n, double power, uint32_t seed);

// Noise with one burst per entry of burst_times_s, frequency offset applied.
std::vector<cfloat> synth_capture(const RawFrame& frame, const SynthOptions& opt);

} // namespace droneid::test
