#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include <liquid/liquid.h>

namespace droneid {

// Owns one liquid-dsp FFT plan together with the buffers it was planned on.
// Not copyable; each worker builds its own plans.
class FftPlan {
public:
    explicit FftPlan(std::size_t n, bool inverse = false);
    ~FftPlan();

    FftPlan(const FftPlan&) = delete;
    FftPlan& operator=(const FftPlan&) = delete;

    // Unnormalised transform of `size()` samples. `in` and `out` may alias.
    void execute(const std::complex<float>* in, std::complex<float>* out);

    std::size_t size() const { return n_; }
    bool inverse() const { return inverse_; }

private:
    std::size_t n_{0};
    bool inverse_{false};
    std::vector<std::complex<float>> inbuf_;
    std::vector<std::complex<float>> outbuf_;
    fftplan plan_{nullptr};
};

} // namespace droneid
