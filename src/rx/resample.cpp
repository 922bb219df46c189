#include "droneid/rx/resample.hpp"

#include <cmath>
#include <numbers>

#include "droneid/errors.hpp"
#include "droneid/workspace.hpp"

namespace droneid::rx {

std::vector<std::complex<float>> resample(std::span<const std::complex<float>> x,
                                          double in_rate_hz,
                                          double out_rate_hz) {
    if (!(in_rate_hz > 0.0) || !(out_rate_hz > 0.0))
        throw ConfigurationError("resample: rates must be positive");
    if (out_rate_hz >= in_rate_hz)
        throw ConfigurationError("resample: output rate must be below input rate");

    const std::size_t n = x.size();
    const std::size_t m = static_cast<std::size_t>(std::llround(static_cast<double>(n) * out_rate_hz / in_rate_hz));
    if (n == 0 || m == 0) return {};

    std::vector<std::complex<float>> spec(n);
    {
        FftPlan fwd(n, false);
        fwd.execute(x.data(), spec.data());
    }

    // The first ceil(m/2) bins (DC included) are the positive half, the rest
    // the negative half. An even-length output splits the Nyquist bin between
    // both ends.
    std::vector<std::complex<float>> narrow(m, {0.f, 0.f});
    const std::size_t pos = (m + 1) / 2;
    const std::size_t neg = m - pos;
    for (std::size_t k = 0; k < pos; ++k)
        narrow[k] = spec[k];
    for (std::size_t k = 0; k < neg; ++k)
        narrow[m - 1 - k] = spec[n - 1 - k];
    if (m % 2 == 0) {
        const auto nyq = spec[pos];
        narrow[pos] = 0.5f * (nyq + spec[n - neg]);
    }

    std::vector<std::complex<float>> y(m);
    FftPlan inv(m, true);
    inv.execute(narrow.data(), y.data());
    const float scale = 1.0f / static_cast<float>(n);
    for (auto& v : y) v *= scale;
    return y;
}

std::vector<std::complex<float>> frequency_shift(std::span<const std::complex<float>> x,
                                                 double offset_hz,
                                                 double sample_rate_hz) {
    if (!(sample_rate_hz > 0.0))
        throw ConfigurationError("frequency_shift: sample rate must be positive");
    std::vector<std::complex<float>> y(x.size());
    const double w = -2.0 * std::numbers::pi * offset_hz / sample_rate_hz;
    for (std::size_t i = 0; i < x.size(); ++i) {
        // wrap the phase before the float conversion so long blocks keep precision
        const double ph = std::remainder(w * static_cast<double>(i), 2.0 * std::numbers::pi);
        y[i] = x[i] * std::complex<float>(static_cast<float>(std::cos(ph)), static_cast<float>(std::sin(ph)));
    }
    return y;
}

} // namespace droneid::rx
