#pragma once
#include <complex>
#include <span>

namespace droneid::rx {

// Occupied-band limits accepted as a DroneID channel (nominal 9.015 MHz).
inline constexpr double kMinOccupiedBandwidthHz = 8.0e6;
inline constexpr double kMaxOccupiedBandwidthHz = 10.0e6;

struct OffsetEstimate {
    double offset_hz = 0.0;    // centre of the occupied band relative to DC
    bool found = false;
    double bandwidth_hz = 0.0; // measured width, 0 when no band was located
};

// Locate the occupied band in the Welch spectrum of `x` and return the offset
// that re-centres it at DC. `found` is false when the measured width lies
// outside [kMinOccupiedBandwidthHz, kMaxOccupiedBandwidthHz]. With
// `skip_bw_check` the width is not checked and `found` is always true; the
// offset is 0 when no band could be measured at all.
OffsetEstimate estimate_offset(std::span<const std::complex<float>> x,
                               double sample_rate_hz,
                               bool skip_bw_check = false);

} // namespace droneid::rx
