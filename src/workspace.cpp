#include "droneid/workspace.hpp"

#include <algorithm>
#include <stdexcept>

namespace droneid {

FftPlan::FftPlan(std::size_t n, bool inverse) : n_(n), inverse_(inverse) {
    if (n == 0)
        throw std::invalid_argument("FFT size must be positive");

    inbuf_.resize(n);
    outbuf_.resize(n);

    plan_ = fft_create_plan(
        static_cast<unsigned int>(n),
        reinterpret_cast<liquid_float_complex*>(inbuf_.data()),
        reinterpret_cast<liquid_float_complex*>(outbuf_.data()),
        inverse ? LIQUID_FFT_BACKWARD : LIQUID_FFT_FORWARD,
        0);
    if (!plan_)
        throw std::runtime_error("fft_create_plan failed");
}

FftPlan::~FftPlan() {
    if (plan_)
        fft_destroy_plan(plan_);
}

void FftPlan::execute(const std::complex<float>* in, std::complex<float>* out) {
    if (in != inbuf_.data())
        std::copy(in, in + n_, inbuf_.begin());
    fft_execute(plan_);
    if (out != outbuf_.data())
        std::copy(outbuf_.begin(), outbuf_.end(), out);
}

} // namespace droneid
