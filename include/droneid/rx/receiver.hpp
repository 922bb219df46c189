#pragma once
#include <complex>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "droneid/capture.hpp"
#include "droneid/config.hpp"
#include "droneid/rx/phase_decoder.hpp"

namespace droneid::rx {

// Outcome of one capture: burst tallies plus every structurally decoded frame.
struct CaptureReport {
    std::size_t bursts_detected = 0; // candidates returned by the detector
    std::size_t bursts_processed = 0; // candidates that reached the phase decoder
    std::size_t crc_valid = 0;
    std::size_t crc_errors = 0;
    std::vector<frame::TelemetryRecord> records;
    std::vector<RawFrame> raw_frames;

    // At least one frame parsed, CRC-valid or not.
    bool detected() const { return !records.empty(); }
};

// Called for each decoded record as soon as it is available.
using RecordCallback = std::function<void(const frame::TelemetryRecord&, const RawFrame&, double center_freq_hz)>;

// Decode chain for whole captures: chunking, burst detection, coarse
// correction, resampling, symbol extraction and phase decoding. One instance
// per worker.
class CaptureDecoder {
public:
    explicit CaptureDecoder(const ReceiverConfig& cfg);

    // Throws ConfigurationError when the capture rate is below the OFDM grid
    // rate. Every per-burst failure, exceptions included, is absorbed and
    // logged; the next candidate is tried.
    CaptureReport decode(const Capture& cap, const RecordCallback& on_record = {});

    // Full chain for a single burst slice at `sample_rate_hz`.
    std::optional<PhaseDecodeResult> decode_burst(std::span<const std::complex<float>> burst,
                                                  double offset_hz,
                                                  double sample_rate_hz) const;

private:
    std::optional<SymbolFrame> burst_symbols(std::span<const std::complex<float>> burst,
                                             double offset_hz,
                                             double sample_rate_hz) const;

    ReceiverConfig cfg_;
};

} // namespace droneid::rx
