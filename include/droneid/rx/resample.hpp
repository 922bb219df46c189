#pragma once
#include <complex>
#include <span>
#include <vector>

namespace droneid::rx {

// Band-limited rate conversion through the frequency domain: forward FFT of
// the whole block, keep the bins that fit below the new Nyquist rate, inverse
// FFT at the new length. The output has round(n * out_rate / in_rate)
// samples. Requires 0 < out_rate < in_rate, else ConfigurationError.
std::vector<std::complex<float>> resample(std::span<const std::complex<float>> x,
                                          double in_rate_hz,
                                          double out_rate_hz);

// Mix `x` down by `offset_hz`: y[n] = x[n] * exp(-j 2π offset n / fs).
std::vector<std::complex<float>> frequency_shift(std::span<const std::complex<float>> x,
                                                 double offset_hz,
                                                 double sample_rate_hz);

} // namespace droneid::rx
