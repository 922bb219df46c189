#pragma once
#include <complex>
#include <optional>
#include <span>

#include "droneid/capture.hpp"

namespace droneid::rx {

struct ExtractorOptions {
    bool legacy = false;
    // Leave the two reference symbols (and the unused leading symbol of the
    // standard frame) out of the result.
    bool skip_zc = true;
    // Minimum normalised correlation with the first reference symbol.
    float min_correlation = 0.5f;
    // Samples the FFT window is pulled back into the cyclic prefix.
    std::size_t cp_backoff = 4;
};

// Sync, fine CFO and equalisation diagnostics of the last extraction.
struct ExtractorReport {
    std::size_t frame_start = 0;
    float correlation = 0.f;
    double fine_cfo_hz = 0.0;
};

// Demodulate one burst sampled at kCanonicalSampleRateHz with its coarse
// offset already removed. Timing comes from the first Zadoff-Chu reference,
// the residual offset from the cyclic prefixes, and the channel from both
// references. Returns std::nullopt on a truncated burst or weak correlation.
std::optional<SymbolFrame> extract_symbols(std::span<const std::complex<float>> burst,
                                           const ExtractorOptions& opt = {},
                                           ExtractorReport* report = nullptr);

} // namespace droneid::rx
