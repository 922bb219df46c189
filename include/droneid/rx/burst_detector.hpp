#pragma once
#include <complex>
#include <span>
#include <vector>

#include "droneid/capture.hpp"
#include "droneid/config.hpp"

namespace droneid::rx {

struct BurstDetection {
    std::vector<BurstCandidate> candidates;
    double last_offset_hz = 0.0; // offset of the last candidate examined, diagnostics only
};

// Short-time power profile: max |STFT| over a 64-bin Hann-windowed,
// non-overlapping transform, one value per 64-sample step.
std::vector<float> stft_max_profile(std::span<const std::complex<float>> x);

// Find bursts whose above-threshold run matches the packet envelope for
// `type`. Each run is widened by kBurstGuardSeconds on both sides and its
// coarse offset estimated. Candidates whose offset cannot be validated are
// dropped unless `legacy`, where they are kept with offset 0. Stops after
// kMaxCandidatesPerCall. Indices are relative to `x`; pure noise yields an
// empty list.
BurstDetection detect_bursts(std::span<const std::complex<float>> x,
                             double sample_rate_hz,
                             PacketType type = PacketType::DroneId,
                             bool legacy = false);

} // namespace droneid::rx
