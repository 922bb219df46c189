#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace droneid {

// OFDM grid the symbol extractor works on. Every burst is brought to this
// rate before demodulation regardless of the front end's native rate.
inline constexpr double      kCanonicalSampleRateHz = 15.36e6;
// Front-end rates this close to the grid are used as-is.
inline constexpr double      kGridRateToleranceHz   = 1.0;
inline constexpr std::size_t kFftSize               = 1024;
inline constexpr double      kSubcarrierSpacingHz   = kCanonicalSampleRateHz / kFftSize; // 15 kHz
inline constexpr std::size_t kDataCarriers          = 600;  // -300..-1, +1..+300, DC null
inline constexpr double      kOccupiedBandwidthHz   = (kDataCarriers + 1) * kSubcarrierSpacingHz;

// Zadoff-Chu reference symbols (length-601 sequence, DC element dropped).
inline constexpr std::size_t kZcLength   = kDataCarriers + 1;
inline constexpr int         kZcRootFirst  = 600;
inline constexpr int         kZcRootSecond = 147;

// Link layer.
inline constexpr std::size_t kPayloadBytes   = 89;
inline constexpr std::size_t kCrcBytes       = 2;
inline constexpr std::size_t kRawFrameBytes  = kPayloadBytes + kCrcBytes; // 91
inline constexpr std::size_t kSystematicBits = 1412;
inline constexpr std::size_t kRawBitsPerFrame = 7200; // 6 payload symbols * 600 * 2

// Descrambler.
inline constexpr uint32_t kGoldNc        = 1600;
inline constexpr uint32_t kScramblerSeed = 0x12345678u;

// Field scaling.
inline constexpr double kCoordinateScale = 174533.0; // raw int32 -> degrees
inline constexpr double kFeetPerMeter    = 3.281;

// Burst detector.
inline constexpr std::size_t kDetectorFftSize     = 64;
inline constexpr double      kDetectorThreshold   = 1.15;
inline constexpr double      kBurstGuardSeconds   = 3 * 15e-6;
inline constexpr std::size_t kMaxCandidatesPerCall = 3;

static_assert(kRawFrameBytes == 91, "DroneID frames are 91 bytes on air");
static_assert(kSystematicBits / 8 >= kRawFrameBytes, "systematic stream must carry a full frame");

} // namespace droneid
