#include "droneid/rx/ofdm.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>

#include "droneid/workspace.hpp"

namespace droneid::rx {

namespace {

FrameLayout make_layout(bool legacy) {
    FrameLayout L;
    if (legacy) {
        L.cp_lengths = {80, 72, 72, 72, 72, 72, 72, 80};
        L.zc_first = 2;
        L.zc_second = 4;
        L.payload_symbols = {0, 1, 3, 5, 6, 7};
    } else {
        L.cp_lengths = {80, 72, 72, 72, 72, 72, 72, 72, 80};
        L.zc_first = 3;
        L.zc_second = 5;
        L.payload_symbols = {1, 2, 4, 6, 7, 8};
    }
    return L;
}

} // namespace

std::size_t FrameLayout::symbol_start(std::size_t i) const {
    std::size_t pos = 0;
    for (std::size_t s = 0; s < i && s < cp_lengths.size(); ++s)
        pos += cp_lengths[s] + kFftSize;
    return pos;
}

const FrameLayout& frame_layout(bool legacy) {
    static const FrameLayout standard = make_layout(false);
    static const FrameLayout old = make_layout(true);
    return legacy ? old : standard;
}

std::size_t carrier_bin(std::size_t k, std::size_t fft_size) {
    if (k >= kDataCarriers)
        throw std::out_of_range("carrier index beyond the data carriers");
    const long half = static_cast<long>(kDataCarriers / 2);
    const long f = static_cast<long>(k) < half ? static_cast<long>(k) - half
                                                : static_cast<long>(k) - half + 1;
    const long n = static_cast<long>(fft_size);
    return static_cast<std::size_t>((f + n) % n);
}

std::vector<std::complex<float>> zadoff_chu(int root, std::size_t length) {
    std::vector<std::complex<float>> z(length);
    const double N = static_cast<double>(length);
    for (std::size_t n = 0; n < length; ++n) {
        // n*(n+1) grows past 2^53 only for lengths far beyond ours
        const double m = std::fmod(static_cast<double>(root) * static_cast<double>(n) * static_cast<double>(n + 1), 2.0 * N);
        const double ph = -std::numbers::pi * m / N;
        z[n] = {static_cast<float>(std::cos(ph)), static_cast<float>(std::sin(ph))};
    }
    return z;
}

std::vector<std::complex<float>> zc_carriers(int root) {
    const auto z = zadoff_chu(root, kZcLength);
    std::vector<std::complex<float>> c;
    c.reserve(kDataCarriers);
    const std::size_t dc = kZcLength / 2;
    for (std::size_t n = 0; n < kZcLength; ++n)
        if (n != dc) c.push_back(z[n]);
    return c;
}

std::vector<std::complex<float>> zc_time_symbol(int root, std::size_t fft_size) {
    const auto c = zc_carriers(root);
    std::vector<std::complex<float>> grid(fft_size, {0.f, 0.f});
    for (std::size_t k = 0; k < kDataCarriers; ++k)
        grid[carrier_bin(k, fft_size)] = c[k];
    std::vector<std::complex<float>> t(fft_size);
    FftPlan inv(fft_size, true);
    inv.execute(grid.data(), t.data());
    return t;
}

} // namespace droneid::rx
